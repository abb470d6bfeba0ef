/** ContactUtils [ContactSync]
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

#ifndef ContactUtils_hpp
#define ContactUtils_hpp

#include <string>
#include <vector>
#include <time.h>
#include <sys/types.h>

class ContactUtils {
public:
    static std::string getEnvUTF8(std::string key);

    // $CONTACTS_DIR, falling back to ~/.config/contacts. Created if missing.
    static std::string configDirPath();
    static void ensureDirectory(std::string path, mode_t mode = 0755);

    // Returns false if the file does not exist. Other failures throw.
    static bool readFile(std::string path, std::string & contents);
    static void writeFile(std::string path, const std::string & contents, mode_t mode);
    static bool removeFile(std::string path);

    static std::string idRandomlyGenerated();
    static std::string randomBytes(size_t count);
    static std::string toBase64URL(const std::string & bytes);
    static std::string sha256(const std::string & input);

    // UTC, second precision: 20240102T030405Z
    static std::string timestampForTime(time_t time);

    static std::string toLowerCase(std::string str);
    static std::string toUpperCase(std::string str);
    static bool equalsIgnoreCase(const std::string & a, const std::string & b);
    static std::string trim(std::string str);

    // Splits on `sep` into at most `max` parts, the last part keeping any
    // remaining separators. `max` of 0 means no limit.
    static std::vector<std::string> split(const std::string & str, char sep, size_t max = 0);
    static std::string lastPathComponent(std::string str);
};

#endif /* ContactUtils_hpp */
