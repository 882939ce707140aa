#pragma once

namespace remauth::lite {

// Semantic versioning for the Lite API
inline constexpr int version_major = 1;
inline constexpr int version_minor = 0;
inline constexpr int version_patch = 0;

} // namespace remauth::lite
