#include <orderpix/downloader/downloader.hpp>

namespace orderpix::downloader {

Error makeHttpStatusError(int status, std::string_view url) {
    Error err;
    err.httpStatus = status;
    err.message = "HTTP " + std::to_string(status) + " for " + std::string(url);
    if (status == 429) {
        err.code = ErrorCode::RateLimited;
    } else if (status >= 500) {
        err.code = ErrorCode::HttpServerError;
    } else if (status >= 400) {
        err.code = ErrorCode::HttpClientError;
    } else {
        err.code = ErrorCode::Unknown;
    }
    return err;
}

bool isTransient(const Error& error) noexcept {
    switch (error.code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
        case ErrorCode::HttpServerError:
        case ErrorCode::RateLimited:
            return true;
        default:
            return false;
    }
}

} // namespace orderpix::downloader
