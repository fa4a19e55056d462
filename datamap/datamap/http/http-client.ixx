namespace datamap
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    // If the certificate file is specified, use that. Otherwise fall back to
    // the system default verify paths.
    //
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (const request_type& req)
  {
    string_type body;

    response_type r (
      co_await stream_impl (req,
                            [] (const response_type&) {return true;},
                            [&body] (const char* d, std::size_t n)
                            {
                              body.append (d, n);
                              return true;
                            },
                            8192,
                            0));

    if (!body.empty ())
      r.body = std::move (body);

    co_return r;
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  stream (const request_type& req,
          head_callback on_head,
          chunk_callback on_chunk,
          std::size_t chunk_size)
  {
    co_return co_await stream_impl (req, on_head, on_chunk, chunk_size, 0);
  }
}
