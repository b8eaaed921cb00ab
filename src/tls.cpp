#include "zia/tls.hpp"

#include "zia/log.hpp"

#ifdef ZIA_WITH_TLS

#include <cerrno>
#include <cstring>

#include <mbedtls/error.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <utility>

#endif  // ZIA_WITH_TLS

namespace zia {

#ifdef ZIA_WITH_TLS

bool tls_available() { return true; }

namespace {

std::string tls_error(int ret) {
  char buf[128];
  mbedtls_strerror(ret, buf, sizeof(buf));
  return std::string(buf) + " (" + std::to_string(ret) + ")";
}

bool is_retry(int ret) {
  if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
    return true;
  }
#ifdef MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET
  if (ret == MBEDTLS_ERR_SSL_RECEIVED_NEW_SESSION_TICKET) {
    return true;
  }
#endif
  return false;
}

constexpr int kWaitSliceMs = 200;

}  // namespace

// ============================================================================
// TlsContext
// ============================================================================

TlsContext::TlsContext() {
  mbedtls_ssl_config_init(&conf_);
  mbedtls_x509_crt_init(&cacert_);
  mbedtls_entropy_init(&entropy_);
  mbedtls_ctr_drbg_init(&ctr_drbg_);
}

TlsContext::~TlsContext() {
  mbedtls_ssl_config_free(&conf_);
  mbedtls_x509_crt_free(&cacert_);
  mbedtls_entropy_free(&entropy_);
  mbedtls_ctr_drbg_free(&ctr_drbg_);
}

int TlsContext::init(const TlsOptions& options) {
  const char* pers = "zia_tls";

  int ret = mbedtls_ctr_drbg_seed(&ctr_drbg_, mbedtls_entropy_func, &entropy_,
                                  reinterpret_cast<const unsigned char*>(pers), strlen(pers));
  if (ret != 0)
    return ret;

  verify_ = !options.insecure;
  if (verify_) {
    ret = mbedtls_x509_crt_parse_file(&cacert_, options.ca_file.c_str());
    // A positive value counts certificates that failed to parse
    if (ret < 0)
      return ret;
  }

  ret = mbedtls_ssl_config_defaults(&conf_, MBEDTLS_SSL_IS_CLIENT, MBEDTLS_SSL_TRANSPORT_STREAM,
                                    MBEDTLS_SSL_PRESET_DEFAULT);
  if (ret != 0)
    return ret;

  mbedtls_ssl_conf_rng(&conf_, mbedtls_ctr_drbg_random, &ctr_drbg_);
  if (options.insecure) {
    mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_NONE);
  } else {
    mbedtls_ssl_conf_ca_chain(&conf_, &cacert_, nullptr);
    mbedtls_ssl_conf_authmode(&conf_, MBEDTLS_SSL_VERIFY_REQUIRED);
  }

  mbedtls_ssl_conf_min_tls_version(&conf_, MBEDTLS_SSL_VERSION_TLS1_2);
  return 0;
}

expected<std::shared_ptr<TlsContext>, ErrorCode> TlsContext::create(const TlsOptions& options) {
  auto ctx = std::make_shared<TlsContext>();
  int ret = ctx->init(options);
  if (ret != 0) {
    ZIA_LOG_ERROR("TLS setup failed: " + tls_error(ret));
    return expected<std::shared_ptr<TlsContext>, ErrorCode>::error(ErrorCode::kTlsError);
  }
  if (options.insecure) {
    ZIA_LOG_WARN("TLS certificate verification is disabled");
  }
  return expected<std::shared_ptr<TlsContext>, ErrorCode>::success(std::move(ctx));
}

// ============================================================================
// TlsStream
// ============================================================================

TlsStream::Session::Session() {
  mbedtls_ssl_init(&ssl);
  mbedtls_net_init(&net);
}

TlsStream::Session::~Session() {
  mbedtls_ssl_free(&ssl);
  mbedtls_net_free(&net);
}

expected<std::unique_ptr<TlsStream>, ErrorCode> TlsStream::connect(sockpp::tcp_socket&& sock,
                                                                   std::shared_ptr<TlsContext> ctx,
                                                                   const std::string& host) {
  using Result = expected<std::unique_ptr<TlsStream>, ErrorCode>;

  auto session = std::make_shared<Session>();
  session->ctx = std::move(ctx);

  int ret = mbedtls_ssl_setup(&session->ssl, session->ctx->config());
  if (ret != 0) {
    ZIA_LOG_ERROR("TLS session setup failed: " + tls_error(ret));
    return Result::error(ErrorCode::kTlsError);
  }

  ret = mbedtls_ssl_set_hostname(&session->ssl, host.c_str());
  if (ret != 0) {
    ZIA_LOG_ERROR("TLS hostname setup failed: " + tls_error(ret));
    return Result::error(ErrorCode::kTlsError);
  }

  // The session owns the descriptor from here on
  session->net.fd = sock.release();
  mbedtls_ssl_set_bio(&session->ssl, &session->net, mbedtls_net_send, mbedtls_net_recv, nullptr);

  while ((ret = mbedtls_ssl_handshake(&session->ssl)) != 0) {
    if (!is_retry(ret)) {
      ZIA_LOG_ERROR("TLS handshake with " + host + " failed: " + tls_error(ret));
      return Result::error(ErrorCode::kTlsError);
    }
  }

  uint32_t flags = mbedtls_ssl_get_verify_result(&session->ssl);
  if (flags != 0 && session->ctx->verifies_peer()) {
    ZIA_LOG_ERROR("TLS certificate of " + host + " not trusted");
    return Result::error(ErrorCode::kTlsError);
  }

  ret = mbedtls_net_set_nonblock(&session->net);
  if (ret != 0) {
    ZIA_LOG_ERROR("Unable to make TLS socket non-blocking: " + tls_error(ret));
    return Result::error(ErrorCode::kTlsError);
  }

  ZIA_LOG_DEBUG(std::string("TLS established using ") + mbedtls_ssl_get_ciphersuite(&session->ssl));
  return Result::success(std::unique_ptr<TlsStream>(new TlsStream(std::move(session))));
}

bool TlsStream::wait_socket(bool for_write) {
  while (!session_->shut.load(std::memory_order_acquire)) {
    struct pollfd pfd;
    pfd.fd = session_->net.fd;
    pfd.events = for_write ? POLLOUT : POLLIN;
    pfd.revents = 0;
    int ret = ::poll(&pfd, 1, kWaitSliceMs);
    if (ret > 0) {
      return true;
    }
    if (ret < 0 && errno != EINTR) {
      return false;
    }
  }
  return false;
}

expected<size_t, ErrorCode> TlsStream::read_some(uint8_t* buf, size_t len) {
  while (true) {
    int ret;
    {
      std::lock_guard<std::mutex> lock(session_->mutex);
      ret = mbedtls_ssl_read(&session_->ssl, buf, len);
    }
    if (ret > 0) {
      return expected<size_t, ErrorCode>::success(static_cast<size_t>(ret));
    }
    if (ret == 0 || ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
    if (!is_retry(ret)) {
      ZIA_LOG_DEBUG("TLS read error: " + tls_error(ret));
      return expected<size_t, ErrorCode>::error(ErrorCode::kTlsError);
    }
    if (!wait_socket(ret == MBEDTLS_ERR_SSL_WANT_WRITE)) {
      return expected<size_t, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
  }
}

expected<void, ErrorCode> TlsStream::write_all(const uint8_t* data, size_t len) {
  size_t sent = 0;
  while (sent < len) {
    int ret;
    {
      std::lock_guard<std::mutex> lock(session_->mutex);
      ret = mbedtls_ssl_write(&session_->ssl, data + sent, len - sent);
    }
    if (ret > 0) {
      sent += static_cast<size_t>(ret);
      continue;
    }
    if (!is_retry(ret)) {
      ZIA_LOG_DEBUG("TLS write error: " + tls_error(ret));
      return expected<void, ErrorCode>::error(ErrorCode::kTlsError);
    }
    if (!wait_socket(ret != MBEDTLS_ERR_SSL_WANT_READ)) {
      return expected<void, ErrorCode>::error(ErrorCode::kConnectionClosed);
    }
  }
  return expected<void, ErrorCode>::success();
}

expected<std::unique_ptr<ByteStream>, ErrorCode> TlsStream::clone() {
  return expected<std::unique_ptr<ByteStream>, ErrorCode>::success(
      std::unique_ptr<ByteStream>(new TlsStream(session_)));
}

void TlsStream::shutdown() {
  if (session_->shut.exchange(true)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(session_->mutex);
    int ret = mbedtls_ssl_close_notify(&session_->ssl);
    if (ret != 0 && !is_retry(ret)) {
      ZIA_LOG_DEBUG("TLS close_notify failed: " + tls_error(ret));
    }
  }
  if (session_->net.fd >= 0) {
    ::shutdown(session_->net.fd, SHUT_RDWR);
  }
}

void TlsStream::close() { shutdown(); }

#else  // !ZIA_WITH_TLS

bool tls_available() { return false; }

#endif  // ZIA_WITH_TLS

}  // namespace zia
