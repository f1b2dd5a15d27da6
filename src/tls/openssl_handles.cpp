#include "peerquic/tls/openssl_handles.hpp"
#include "peerquic/core/constants.hpp"
#include <openssl/err.h>
namespace peerquic::tls {
std::string GetOpenSSLError() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "unknown OpenSSL error";
    }
    std::string message;
    while (err != 0) {
        char buffer[OpenSSLConstants::ERROR_BUFFER_SIZE];
        ERR_error_string_n(err, buffer, sizeof(buffer));
        if (!message.empty()) {
            message += "; ";
        }
        message += buffer;
        err = ERR_get_error();
    }
    return message;
}
}
