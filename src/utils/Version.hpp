#pragma once

namespace rotor::version
{

// Compile-time helpers derived from ROTOR_BUILD_VERSION that keep user-facing
// strings consistent.
inline constexpr char const kSemanticVersion[] = ROTOR_BUILD_VERSION;
inline constexpr char const kDisplayVersion[] = "Rotor " ROTOR_BUILD_VERSION;

} // namespace rotor::version
