/** SPDLogExtensions [ContactSync]
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

#ifndef SPDLogExtensions_h
#define SPDLogExtensions_h

#include <memory>
#include <string>

#include "spdlog/spdlog.h"
#include "spdlog/pattern_formatter.h"
#include "contactsync/thread_utils.hpp"

// Adds %N to the log pattern: the name given to the thread with SetThreadName.
class SPDThreadNameFlag : public spdlog::custom_flag_formatter {
public:
    void format(const spdlog::details::log_msg & msg, const std::tm &, spdlog::memory_buf_t & dest) override {
        std::string name = GetThreadName(msg.thread_id);
        dest.append(name.data(), name.data() + name.size());
    }

    std::unique_ptr<custom_flag_formatter> clone() const override {
        return spdlog::details::make_unique<SPDThreadNameFlag>();
    }
};

inline std::unique_ptr<spdlog::pattern_formatter> SPDFormatterWithThreadNames(const std::string & pattern) {
    auto formatter = spdlog::details::make_unique<spdlog::pattern_formatter>();
    formatter->add_flag<SPDThreadNameFlag>('N').set_pattern(pattern);
    return formatter;
}

#endif /* SPDLogExtensions_h */
