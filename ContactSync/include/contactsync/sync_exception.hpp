/** SyncException [ContactSync]
 *
 * Author(s): Ben Gotow
 */

/* LICENSE
* Copyright (C) 2017-2021 Foundry 376.
*
* This program is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/

#ifndef SyncException_hpp
#define SyncException_hpp

#include <string>
#include <curl/curl.h>
#include "nlohmann/json.hpp"
#include "contactsync/generic_exception.hpp"

// Keys for failures raised by ContactSync itself. Provider failures use
// the HTTP status ("Invalid Response Code: 404") or the curl error string.
static const std::string SYNC_KEY_NOT_FOUND = "contact-not-found";
static const std::string SYNC_KEY_INVALID_INPUT = "invalid-input";
static const std::string SYNC_KEY_IO_ERROR = "io-error";
static const std::string SYNC_KEY_NOT_AUTHORIZED = "not-authorized";
static const std::string SYNC_KEY_MISSING_CREDENTIALS = "missing-credentials";
static const std::string SYNC_KEY_STATE_MISMATCH = "state-mismatch";
static const std::string SYNC_KEY_AUTHORIZATION_FAILED = "authorization-failed";
static const std::string SYNC_KEY_LISTENER_FAILED = "listener-failed";
static const std::string SYNC_KEY_CANCELLED = "cancelled";

class SyncException : public GenericException {
    bool retryable = false;
    std::string _what;

public:
    SyncException(std::string key, std::string di, bool retryable);
    SyncException(CURLcode c, std::string di);
    std::string key;
    std::string debuginfo;
    bool isRetryable();
    const char * what() const noexcept override;
    nlohmann::json toJSON();
};

// Wraps errno for a failed file-system operation on `path`.
SyncException IOException(std::string operation, std::string path);

#endif /* SyncException_hpp */
