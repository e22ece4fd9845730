#ifndef SOLO_VERSION_HPP
#define SOLO_VERSION_HPP

#include <string>

namespace solo {

const std::string SOLO_VERSION_STRING = "1.2.0";

} // namespace solo

#endif // SOLO_VERSION_HPP
