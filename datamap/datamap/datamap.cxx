#include <csignal>
#include <iostream>
#include <optional>
#include <filesystem>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>

#include <datamap/datamap-options.hxx>
#include <datamap/datamap-settings.hxx>
#include <datamap/datamap-download.hxx>
#include <datamap/diagnostics.hxx>
#include <datamap/version.hxx>

using namespace std;
namespace fs = filesystem;
namespace asio = boost::asio;

namespace datamap
{
  static const char* const usage =
    "usage: datamap [options] download file <dataset-id> <version> <file-id>\n"
    "       datamap [options] download version <dataset-id> <version>\n"
    "       datamap [options] health\n";

  // Map the command line options to a settings layer.
  //
  static settings_layer
  flag_settings (const options& o)
  {
    settings_layer r;
    r.source = "command line";

    if (o.api_url_specified ())    r.api_base_url         = o.api_url ();
    if (o.timeout_specified ())    r.timeout              = o.timeout ();
    if (o.retries_specified ())    r.retry_attempts       = o.retries ();
    if (o.jobs_specified ())       r.download_concurrency = o.jobs ();
    if (o.chunk_size_specified ()) r.chunk_size           = o.chunk_size ();

    if (o.quiet ())
      r.verbosity = 0;
    else if (o.verbose ())
      r.verbosity = 2;

    if (o.resume ())
      r.resume = true;

    if (o.no_verify_checksum ())
      r.verify = false;

    return r;
  }

  // Resolve the settings from all the sources.
  //
  static settings
  load_settings (const options& o)
  {
    settings_layer file;

    if (o.config_specified ())
      file = load_settings_file (fs::path (o.config ()));
    else if (optional<fs::path> f = default_config_file (process_env))
    {
      error_code ec;
      if (fs::exists (*f, ec))
        file = load_settings_file (*f);
    }

    return resolve_settings (file,
                             load_settings_env (process_env),
                             flag_settings (o));
  }
}

int
main (int argc, char* argv[])
{
  using namespace std;
  using namespace datamap;

  try
  {
    // Positional arguments are left in argv, options may appear anywhere.
    //
    options opt (argc,
                 argv,
                 true /* erase */,
                 cli::unknown_mode::fail,
                 cli::unknown_mode::skip);

    // Handle --version.
    //
    if (opt.version ())
    {
      auto& o (cout);

      o << "datamap " << DATAMAP_VERSION_ID << "\n";

      return 0;
    }

    // Handle --help.
    //
    if (opt.help ())
    {
      auto& o (cout);

      o << usage
        << "options:" << "\n";

      opt.print_usage (o);

      return 0;
    }

    vector<string> args (argv + 1, argv + argc);

    auto bad_usage = [] (const string& m)
    {
      cerr << "error: " << m << "\n" << usage;
      return static_cast<int> (exit_partial);
    };

    if (args.empty ())
      return bad_usage ("command expected");

    const string& cmd (args[0]);

    if (cmd == "download")
    {
      if (args.size () < 2)
        return bad_usage ("download: 'file' or 'version' expected");

      if (args[1] == "file" && args.size () != 5)
        return bad_usage ("download file: <dataset-id> <version> <file-id> "
                          "expected");

      if (args[1] == "version" && args.size () != 4)
        return bad_usage ("download version: <dataset-id> <version> "
                          "expected");

      if (args[1] != "file" && args[1] != "version")
        return bad_usage ("download: unknown subcommand '" + args[1] + "'");
    }
    else if (cmd == "health")
    {
      if (args.size () != 1)
        return bad_usage ("health: unexpected argument '" + args[1] + "'");
    }
    else
      return bad_usage ("unknown command '" + cmd + "'");

    // Apply the command line verbosity right away so that configuration
    // diagnostics honor it.
    //
    if (opt.quiet ())
      verb = 0;
    else if (opt.verbose ())
      verb = 2;

    settings s (load_settings (opt));
    verb = s.verbosity;

    asio::io_context ioc;
    download_coordinator dc (ioc, s);

    optional<fs::path> out;
    if (opt.output_specified ())
      out = fs::path (opt.output ());

    // Interrupts pause the active downloads instead of killing the process
    // so that the partial files stay consistent.
    //
    asio::signal_set signals (ioc, SIGINT, SIGTERM);
    signals.async_wait (
      [&dc] (const boost::system::error_code& ec, int)
      {
        if (!ec)
          dc.cancel ();
      });

    auto command = [&] () -> asio::awaitable<int>
    {
      if (cmd == "health")
        return dc.health ();

      if (args[1] == "file")
        return dc.download_file (args[2], args[3], args[4], out);

      return dc.download_version (args[2], args[3], out);
    };

    int exit_code (0);

    asio::co_spawn (
      ioc,
      command (),
      [&exit_code, &ioc, &signals] (exception_ptr ex, int r)
      {
        exit_code = r;

        if (ex)
        {
          try { rethrow_exception (ex); }
          catch (const exception& e)
          {
            error () << e.what ();
            exit_code = exit_partial;
          }
        }

        signals.cancel ();
        ioc.stop ();
      });

    ioc.run ();
    return exit_code;
  }
  catch (const cli::exception& ex)
  {
    cerr << "error: " << ex.what () << "\n" << usage;
    return exit_partial;
  }
  catch (const exception& ex)
  {
    error () << ex.what ();
    return exit_partial;
  }
}
