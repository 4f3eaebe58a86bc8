#include "domain/value_objects/SessionId.hpp"

#include "domain/errors/DomainErrors.hpp"
#include "domain/value_objects/Uuid.hpp"

namespace ses::domain {

SessionId::SessionId(std::string value) : value_(std::move(value)) {}

SessionId SessionId::generate() {
    return SessionId(Uuid::generate().str());
}

SessionId SessionId::from_string(const std::string& value) {
    if (!Uuid::is_valid(value)) {
        throw InvalidSessionIdError(value);
    }
    return SessionId(value);
}

} // namespace ses::domain
