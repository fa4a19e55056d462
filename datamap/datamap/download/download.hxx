#pragma once

#include <datamap/download/download-types.hxx>
#include <datamap/download/download-request.hxx>
#include <datamap/download/download-result.hxx>
#include <datamap/download/download-task.hxx>
#include <datamap/download/download-worker.hxx>
#include <datamap/download/download-manager.hxx>

#include <datamap/api/api-client.hxx>

namespace datamap
{
  using download_worker  = basic_download_worker<api_client>;
  using download_manager = basic_download_manager<api_client>;
}
