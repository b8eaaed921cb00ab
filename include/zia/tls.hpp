#ifndef ZIA_TLS_HPP_
#define ZIA_TLS_HPP_

// ============================================================================
// TLS client transport (wss://)
// ============================================================================
//
// Optional TLS support via mbedTLS. Enable with CMake option ZIA_WITH_TLS=ON.
// When disabled, wss:// upstreams are refused with kTlsError.
//
// Usage:
//   zia::TlsOptions tls;
//   tls.ca_file = "/etc/ssl/certs/ca-certificates.crt";
//   auto ctx = zia::TlsContext::create(tls);
//   auto stream = zia::TlsStream::connect(std::move(sock), ctx.value(), host);
//

#include "stream.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>

#ifdef ZIA_WITH_TLS

#include <atomic>
#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <mbedtls/x509_crt.h>
#include <mutex>

#endif  // ZIA_WITH_TLS

namespace zia {

static constexpr const char* kDefaultCaFile = "/etc/ssl/certs/ca-certificates.crt";

struct TlsOptions {
  std::string ca_file = kDefaultCaFile;  // PEM bundle used to verify the upstream
  bool insecure = false;                 // skip certificate verification
};

// True when the build carries a TLS implementation.
bool tls_available();

#ifdef ZIA_WITH_TLS

// ============================================================================
// TlsContext (one per process, shared by every upstream connection)
// ============================================================================

class TlsContext {
 public:
  TlsContext();
  ~TlsContext();

  TlsContext(const TlsContext&) = delete;
  TlsContext& operator=(const TlsContext&) = delete;

  // Returns 0 on success, an mbedtls error code on failure
  int init(const TlsOptions& options);

  static expected<std::shared_ptr<TlsContext>, ErrorCode> create(const TlsOptions& options);

  const mbedtls_ssl_config* config() const { return &conf_; }

  bool verifies_peer() const { return verify_; }

 private:
  mbedtls_ssl_config conf_;
  mbedtls_x509_crt cacert_;
  mbedtls_entropy_context entropy_;
  mbedtls_ctr_drbg_context ctr_drbg_;
  bool verify_ = true;
};

// ============================================================================
// TlsStream (one session; clones share it)
// ============================================================================
//
// The socket is non-blocking after the handshake. Session calls are
// serialized by a mutex that is released while waiting for the socket, so a
// reader blocked on input never holds up a writer.

class TlsStream : public ByteStream {
 public:
  // Performs the TLS handshake over an already connected socket.
  static expected<std::unique_ptr<TlsStream>, ErrorCode> connect(sockpp::tcp_socket&& sock,
                                                                 std::shared_ptr<TlsContext> ctx,
                                                                 const std::string& host);

  ~TlsStream() override = default;

  expected<size_t, ErrorCode> read_some(uint8_t* buf, size_t len) override;
  expected<void, ErrorCode> write_all(const uint8_t* data, size_t len) override;
  expected<std::unique_ptr<ByteStream>, ErrorCode> clone() override;
  void shutdown() override;
  void close() override;

 private:
  struct Session {
    Session();
    ~Session();

    std::shared_ptr<TlsContext> ctx;
    mbedtls_ssl_context ssl;
    mbedtls_net_context net;
    std::mutex mutex;
    std::atomic<bool> shut{false};
  };

  explicit TlsStream(std::shared_ptr<Session> session) : session_(std::move(session)) {}

  // Waits until the socket is readable (or writable) or the session is shut.
  bool wait_socket(bool for_write);

  std::shared_ptr<Session> session_;
};

#else  // !ZIA_WITH_TLS

class TlsContext {
 public:
  static expected<std::shared_ptr<TlsContext>, ErrorCode> create(const TlsOptions& /* options */) {
    return expected<std::shared_ptr<TlsContext>, ErrorCode>::error(ErrorCode::kTlsError);
  }
};

#endif  // ZIA_WITH_TLS

}  // namespace zia

#endif  // ZIA_TLS_HPP_
