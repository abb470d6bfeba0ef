#include "contactsync/sync_exception.hpp"

#include <cerrno>
#include <cstring>

SyncException::SyncException(std::string key, std::string di, bool retryable) :
    GenericException(), retryable(retryable), key(key), debuginfo(di)
{
    _what = di == "" ? key : key + ": " + di;
}

SyncException::SyncException(CURLcode c, std::string di) :
    GenericException(), key(curl_easy_strerror(c)), debuginfo(di)
{
    if ((c == CURLE_COULDNT_RESOLVE_PROXY) ||
        (c == CURLE_COULDNT_RESOLVE_HOST) ||
        (c == CURLE_COULDNT_CONNECT) ||
        (c == CURLE_HTTP_RETURNED_ERROR) ||
        (c == CURLE_OPERATION_TIMEDOUT) ||
        (c == CURLE_PARTIAL_FILE) ||
        (c == CURLE_HTTP_POST_ERROR) ||
        (c == CURLE_SSL_CONNECT_ERROR) ||
        (c == CURLE_TOO_MANY_REDIRECTS) ||
        (c == CURLE_PEER_FAILED_VERIFICATION) ||
        (c == CURLE_GOT_NOTHING) ||
        (c == CURLE_SEND_ERROR) ||
        (c == CURLE_RECV_ERROR) ||
        (c == CURLE_AGAIN)) {
        retryable = true;
    }
    _what = key + ": " + di;
}

bool SyncException::isRetryable() {
    return retryable;
}

const char * SyncException::what() const noexcept {
    return _what.c_str();
}

nlohmann::json SyncException::toJSON() {
    return {
        {"what", what()},
        {"key", key},
        {"debuginfo", debuginfo},
        {"retryable", retryable},
    };
}

SyncException IOException(std::string operation, std::string path) {
    int err = errno;
    return SyncException(SYNC_KEY_IO_ERROR, operation + " " + path + ": " + strerror(err), false);
}
