namespace hltb
{
  template <typename T>
  inline basic_http_client<T>::
  basic_http_client (asio::io_context& ioc, traits_type tr)
    : ioc_ (ioc),
      traits_ (std::move (tr)),
      tls_ (ssl::context::tls_client)
  {
    if (traits_.ca_file.empty ())
      tls_.set_default_verify_paths ();
    else
      tls_.load_verify_file (traits_.ca_file);

    tls_.set_options (ssl::context::default_workarounds |
                      ssl::context::no_sslv2 |
                      ssl::context::no_sslv3 |
                      ssl::context::no_tlsv1 |
                      ssl::context::no_tlsv1_1);

    tls_.set_verify_mode (traits_.verify_peer ? ssl::verify_peer
                                              : ssl::verify_none);
  }
}
