#ifndef SOLO_ROLE_HPP
#define SOLO_ROLE_HPP

#include <string>

namespace solo {

enum class Role {
    HOST,   // Won the endpoint and runs the accept loop
    CLIENT  // Lost the race; forwards its arguments at most once
};

inline std::string roleString(Role role) {
    switch (role) {
        case Role::HOST:   return "Host";
        case Role::CLIENT: return "Client";
        default:           return "Unknown";
    }
}

} // namespace solo

#endif // SOLO_ROLE_HPP
