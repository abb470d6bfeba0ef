/** Contact [ContactSync]
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

#ifndef Contact_hpp
#define Contact_hpp

#include <memory>
#include <string>
#include <vector>
#include <time.h>

#include "contactsync/vcard.hpp"
#include "contactsync/models/contact_id.hpp"

struct ContactField {
    std::string value;
    std::string type;
};

class Contact {
    std::shared_ptr<VCard> _card;

public:
    Contact();
    explicit Contact(std::string vcf);
    explicit Contact(std::shared_ptr<VCard> card);

    // A new locally-generated contact, not yet known to Google.
    static std::shared_ptr<Contact> fresh(std::string fullName);

    std::shared_ptr<VCard> card();
    std::string serialize();

    ContactId id();
    std::string uid();
    void setId(ContactId id);

    // Presence of the resource name marks the contact as Google-assigned.
    std::string googleResourceName();
    void setGoogleResourceName(std::string rn);
    std::string etag();
    void setEtag(std::string etag);

    std::string fullName();
    void setFullName(std::string name);
    std::vector<std::string> nameParts();

    std::string primaryPhone();
    std::string primaryEmail();
    std::vector<ContactField> fieldsWithName(std::string name);

    std::string revision();
    void setRevision(time_t time);
    std::string lastSynced();
    void setLastSynced(time_t time);
};

#endif /* Contact_hpp */
