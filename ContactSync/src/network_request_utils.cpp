#include "contactsync/network_request_utils.hpp"
#include "contactsync/sync_exception.hpp"

#include <algorithm>
#include <cstring>
#include <sys/stat.h>

static std::string FindLinuxCertsBundle() {
#ifdef __linux__
    std::string certificatePaths[] = {
        // Debian, Ubuntu, Arch: maintained by update-ca-certificates
        "/etc/ssl/certs/ca-certificates.crt",
        // Red Hat 5+, Fedora, Centos
        "/etc/pki/tls/certs/ca-bundle.crt",
        // Red Hat 4
        "/usr/share/ssl/certs/ca-bundle.crt",
        // OpenSUSE
        "/etc/ssl/ca-bundle.pem",
    };
    for (const auto & path : certificatePaths) {
        struct stat buffer;
        if (stat(path.c_str(), &buffer) == 0) {
            return path;
        }
    }
#endif
    return "";
}

// The header list is parked on the handle so it can be freed with it.
static void AttachHeaders(CURL * curl_handle, struct curl_slist * headers) {
    curl_easy_setopt(curl_handle, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_handle, CURLOPT_PRIVATE, (void *)headers);
}

static void CleanupRequest(CURL * curl_handle) {
    char * headers = nullptr;
    curl_easy_getinfo(curl_handle, CURLINFO_PRIVATE, &headers);
    curl_easy_cleanup(curl_handle);
    if (headers != nullptr) {
        curl_slist_free_all((struct curl_slist *)headers);
    }
}

size_t _onAppendToString(void *contents, size_t length, size_t nmemb, void *userp) {
    std::string * buffer = (std::string *)userp;
    size_t real_size = length * nmemb;

    size_t oldLength = buffer->size();
    size_t newLength = oldLength + real_size;

    buffer->resize(newLength);
    std::copy((char*)contents, (char*)contents+real_size, buffer->begin() + oldLength);

    return real_size;
}

std::string EscapeURLComponent(std::string value) {
    CURL * curl_handle = curl_easy_init();
    char * escaped = curl_easy_escape(curl_handle, value.c_str(), (int)value.size());
    std::string result = escaped ? std::string(escaped) : "";
    curl_free(escaped);
    curl_easy_cleanup(curl_handle);
    return result;
}

std::string EncodeFormFields(const std::map<std::string, std::string> & fields) {
    std::string payload = "";
    for (const auto & pair : fields) {
        if (payload != "") {
            payload += "&";
        }
        payload += EscapeURLComponent(pair.first) + "=" + EscapeURLComponent(pair.second);
    }
    return payload;
}

CURL * CreateJSONRequest(std::string url, std::string method, std::string authorization, const char * payloadChars) {
    CURL * curl_handle = curl_easy_init();
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, 20);

    struct curl_slist *headers = NULL;

    headers = curl_slist_append(headers, "Accept: application/json");

    if (authorization != "") {
        headers = curl_slist_append(headers, ("Authorization: " + authorization).c_str());
    }
    if (payloadChars != nullptr && strlen(payloadChars) > 0) {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl_handle, CURLOPT_COPYPOSTFIELDS, payloadChars);
    }
    AttachHeaders(curl_handle, headers);
    curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, method.c_str());

    return curl_handle;
}

CURL * CreateFormRequest(std::string url, const std::map<std::string, std::string> & fields) {
    CURL * curl_handle = curl_easy_init();
    curl_easy_setopt(curl_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle, CURLOPT_CONNECTTIMEOUT, 20);

    struct curl_slist *headers = NULL;
    headers = curl_slist_append(headers, "Accept: application/json");
    headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
    AttachHeaders(curl_handle, headers);

    std::string payload = EncodeFormFields(fields);
    curl_easy_setopt(curl_handle, CURLOPT_CUSTOMREQUEST, "POST");
    curl_easy_setopt(curl_handle, CURLOPT_COPYPOSTFIELDS, payload.c_str());
    return curl_handle;
}

const nlohmann::json MakeOAuthRefreshRequest(std::string tokenUrl, std::string clientId, std::string clientSecret, std::string refreshToken) {
    return PerformJSONRequest(CreateFormRequest(tokenUrl, {
        {"grant_type", "refresh_token"},
        {"client_id", clientId},
        {"client_secret", clientSecret},
        {"refresh_token", refreshToken},
    }));
}

const nlohmann::json MakeOAuthCodeExchangeRequest(std::string tokenUrl, std::string clientId, std::string clientSecret, std::string code, std::string codeVerifier, std::string redirectUri) {
    return PerformJSONRequest(CreateFormRequest(tokenUrl, {
        {"grant_type", "authorization_code"},
        {"client_id", clientId},
        {"client_secret", clientSecret},
        {"code", code},
        {"code_verifier", codeVerifier},
        {"redirect_uri", redirectUri},
    }));
}

const std::string PerformRequest(CURL * curl_handle) {
    // Ensure /all/ curl code paths run this code for RHEL 7.6 and other linux distros
    std::string explicitCertsBundlePath = FindLinuxCertsBundle();
    if (explicitCertsBundlePath != "") {
        curl_easy_setopt(curl_handle, CURLOPT_CAINFO, explicitCertsBundlePath.c_str());
    }

    std::string result;
    curl_easy_setopt(curl_handle, CURLOPT_WRITEFUNCTION, _onAppendToString);
    curl_easy_setopt(curl_handle, CURLOPT_WRITEDATA, (void *)&result);
    CURLcode res = curl_easy_perform(curl_handle);
    try {
        ValidateRequestResp(res, curl_handle, result);
    } catch (SyncException &) {
        CleanupRequest(curl_handle);
        throw;
    }
    CleanupRequest(curl_handle);
    return result;
}

const nlohmann::json PerformJSONRequest(CURL * curl_handle) {
    std::string result = PerformRequest(curl_handle);
    nlohmann::json resultJSON = nullptr;
    try {
        resultJSON = nlohmann::json::parse(result);
    } catch (nlohmann::json::exception &) {
        resultJSON = {{"text", result}};
    }
    return resultJSON;
}

void ValidateRequestResp(CURLcode res, CURL * curl_handle, std::string resp) {
    char * _url = nullptr;
    if (curl_easy_getinfo(curl_handle, CURLINFO_EFFECTIVE_URL, &_url) != CURLE_OK || _url == nullptr) {
        throw SyncException(res, "Unable to get URL");
    }
    std::string url { _url };

    if (res != CURLE_OK) {
        throw SyncException(res, url);
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code < 200 || http_code > 209) {
        bool retryable = ((http_code != 403) && (http_code != 401) && (http_code != 400) && (http_code != 404));
        if (resp.find("invalid_grant") != std::string::npos) {
            retryable = false;
        }

        std::string debuginfo = url + " RETURNED " + resp;
        throw SyncException("Invalid Response Code: " + std::to_string(http_code), debuginfo, retryable);
    }
}
