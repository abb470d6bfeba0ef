#include "contactsync/models/contact_id.hpp"
#include "contactsync/constants.hpp"

ContactId::ContactId(ContactOrigin origin, std::string value) :
    _origin(origin), _value(value)
{
}

ContactId ContactId::local(std::string value) {
    return ContactId(ContactOrigin::Local, value);
}

ContactId ContactId::provider(std::string value) {
    return ContactId(ContactOrigin::Provider, value);
}

ContactOrigin ContactId::origin() const {
    return _origin;
}

bool ContactId::isProvider() const {
    return _origin == ContactOrigin::Provider;
}

const std::string & ContactId::value() const {
    return _value;
}

bool ContactId::empty() const {
    return _value == "";
}

std::string ContactId::resourceName() const {
    if (!isProvider() || _value == "") {
        return "";
    }
    return GOOGLE_RESOURCE_PREFIX + _value;
}

bool ContactId::operator==(const ContactId & other) const {
    return _origin == other._origin && _value == other._value;
}

bool ContactId::operator!=(const ContactId & other) const {
    return !(*this == other);
}
