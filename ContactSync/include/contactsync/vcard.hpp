/** VCard [ContactSync]
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

#ifndef VCard_hpp
#define VCard_hpp

#include <vector>
#include <memory>
#include <string>
#include <utility>

class VCardProperty
{
    std::string _group;
    std::string _name;
    std::string _value;
    std::vector<std::pair<std::string, std::string>> _params;
    bool _malformed = false;

    public:
    VCardProperty(std::string name, std::string value, std::string type = "");
    explicit VCardProperty(std::string line);

    std::string getName();
    std::string getGroup();

    // Values are held unescaped, except that N, ADR and ORG keep their
    // component escapes. serialize() escapes them again.
    std::string getValue();
    void setValue(std::string value);

    std::string getParameter(std::string name);
    void setParameter(std::string name, std::string value);
    std::string getType();

    bool malformed();
    std::string serialize();

    // Structured values (N, ADR, ORG) are ';' separated components in which
    // a literal ';' is written as "\;" and a literal '\' as "\\".
    static std::vector<std::string> splitComponents(const std::string & value, size_t max = 0);
    static std::string joinComponents(const std::vector<std::string> & components);
};

class VCard
{
    std::vector<std::shared_ptr<VCardProperty>> _properties;
    bool _sawBegin = false;
    bool _sawEnd = false;
    bool _malformed = false;

public:
    VCard();
    explicit VCard(std::string vcf);

    // True if the document was not framed by BEGIN/END:VCARD or had a
    // content line that could not be parsed.
    bool incomplete();

    std::vector<std::shared_ptr<VCardProperty>> properties();
    std::vector<std::shared_ptr<VCardProperty>> propertiesWithName(std::string name);
    std::shared_ptr<VCardProperty> firstPropertyWithName(std::string name);
    std::vector<std::shared_ptr<VCardProperty>> getExtendedProperties();

    // Value of the first property with `name`, or "".
    std::string getValue(std::string name);
    // Replaces every property with `name` by a single one holding `value`.
    void setValue(std::string name, std::string value, std::string type = "");

    std::shared_ptr<VCardProperty> addProperty(std::string name, std::string value, std::string type = "");
    void addProperty(std::shared_ptr<VCardProperty> prop);
    void removePropertiesWithName(std::string name);

    std::string serialize();
};

#endif
