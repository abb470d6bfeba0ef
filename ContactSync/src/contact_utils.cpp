#include "contactsync/contact_utils.hpp"
#include "contactsync/constants.hpp"
#include "contactsync/sync_exception.hpp"
#include "picosha2.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <random>

#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

std::string ContactUtils::getEnvUTF8(std::string key) {
    const char * val = getenv(key.c_str());
    if (val == nullptr) {
        return "";
    }
    return std::string(val);
}

std::string ContactUtils::configDirPath() {
    std::string dir = getEnvUTF8(CONFIG_DIR_ENV);
    if (dir == "") {
        std::string home = getEnvUTF8("HOME");
        if (home == "") {
            throw SyncException(SYNC_KEY_INVALID_INPUT, "Neither " + CONFIG_DIR_ENV + " nor HOME is set.", false);
        }
        dir = home + CONFIG_DIR_DEFAULT_SUFFIX;
    }
    ensureDirectory(dir, 0755);
    return dir;
}

void ContactUtils::ensureDirectory(std::string path, mode_t mode) {
    // create each missing component, like mkdir -p
    for (size_t i = 1; i <= path.size(); i++) {
        if (i != path.size() && path[i] != '/') {
            continue;
        }
        std::string partial = path.substr(0, i);
        struct stat buffer;
        if (stat(partial.c_str(), &buffer) == 0) {
            if (!S_ISDIR(buffer.st_mode)) {
                throw SyncException(SYNC_KEY_IO_ERROR, "mkdir " + partial + ": not a directory", false);
            }
            continue;
        }
        if (mkdir(partial.c_str(), mode) != 0 && errno != EEXIST) {
            throw IOException("mkdir", partial);
        }
    }
}

bool ContactUtils::readFile(std::string path, std::string & contents) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        if (errno == ENOENT) {
            return false;
        }
        throw IOException("open", path);
    }
    std::string result;
    char buffer[8192];
    while (true) {
        ssize_t count = read(fd, buffer, sizeof(buffer));
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            SyncException ex = IOException("read", path);
            close(fd);
            throw ex;
        }
        if (count == 0) {
            break;
        }
        result.append(buffer, count);
    }
    close(fd);
    contents = result;
    return true;
}

void ContactUtils::writeFile(std::string path, const std::string & contents, mode_t mode) {
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (fd < 0) {
        throw IOException("open", path);
    }
    // open() only applies the mode to new files
    if (fchmod(fd, mode) != 0) {
        SyncException ex = IOException("chmod", path);
        close(fd);
        throw ex;
    }
    size_t written = 0;
    while (written < contents.size()) {
        ssize_t count = write(fd, contents.data() + written, contents.size() - written);
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            SyncException ex = IOException("write", path);
            close(fd);
            throw ex;
        }
        written += count;
    }
    if (close(fd) != 0) {
        throw IOException("close", path);
    }
}

bool ContactUtils::removeFile(std::string path) {
    if (unlink(path.c_str()) != 0) {
        if (errno == ENOENT) {
            return false;
        }
        throw IOException("remove", path);
    }
    return true;
}

std::string ContactUtils::randomBytes(size_t count) {
    std::random_device rd;
    std::string bytes;
    bytes.reserve(count);
    while (bytes.size() < count) {
        unsigned int chunk = rd();
        for (size_t i = 0; i < sizeof(chunk) && bytes.size() < count; i++) {
            bytes.push_back((char)((chunk >> (i * 8)) & 0xFF));
        }
    }
    return bytes;
}

std::string ContactUtils::idRandomlyGenerated() {
    // RFC 4122 version 4
    std::string bytes = randomBytes(16);
    bytes[6] = (char)((bytes[6] & 0x0F) | 0x40);
    bytes[8] = (char)((bytes[8] & 0x3F) | 0x80);

    static const char * hex = "0123456789abcdef";
    std::string id;
    for (size_t i = 0; i < bytes.size(); i++) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            id += "-";
        }
        unsigned char c = (unsigned char)bytes[i];
        id += hex[c >> 4];
        id += hex[c & 0x0F];
    }
    return id;
}

std::string ContactUtils::toBase64URL(const std::string & bytes) {
    static const char * alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string out;
    size_t i = 0;
    while (i + 3 <= bytes.size()) {
        unsigned int n = ((unsigned char)bytes[i] << 16) | ((unsigned char)bytes[i + 1] << 8) | (unsigned char)bytes[i + 2];
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
        out += alphabet[n & 0x3F];
        i += 3;
    }
    size_t rest = bytes.size() - i;
    if (rest == 1) {
        unsigned int n = (unsigned char)bytes[i] << 16;
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
    } else if (rest == 2) {
        unsigned int n = ((unsigned char)bytes[i] << 16) | ((unsigned char)bytes[i + 1] << 8);
        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        out += alphabet[(n >> 6) & 0x3F];
    }
    return out;
}

std::string ContactUtils::sha256(const std::string & input) {
    std::vector<unsigned char> hash(picosha2::k_digest_size);
    picosha2::hash256(input.begin(), input.end(), hash.begin(), hash.end());
    return std::string(hash.begin(), hash.end());
}

std::string ContactUtils::timestampForTime(time_t time) {
    struct tm utc;
    gmtime_r(&time, &utc);
    char buffer[32];
    strftime(buffer, sizeof(buffer), "%Y%m%dT%H%M%SZ", &utc);
    return std::string(buffer);
}

std::string ContactUtils::toLowerCase(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return (char)tolower(c); });
    return str;
}

std::string ContactUtils::toUpperCase(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return (char)toupper(c); });
    return str;
}

bool ContactUtils::equalsIgnoreCase(const std::string & a, const std::string & b) {
    return toLowerCase(a) == toLowerCase(b);
}

std::string ContactUtils::trim(std::string str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> ContactUtils::split(const std::string & str, char sep, size_t max) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (max == 0 || parts.size() + 1 < max) {
        size_t idx = str.find(sep, start);
        if (idx == std::string::npos) {
            break;
        }
        parts.push_back(str.substr(start, idx - start));
        start = idx + 1;
    }
    parts.push_back(str.substr(start));
    return parts;
}

std::string ContactUtils::lastPathComponent(std::string str) {
    size_t slash = str.rfind('/');
    if (slash == std::string::npos) {
        return str;
    }
    return str.substr(slash + 1);
}
