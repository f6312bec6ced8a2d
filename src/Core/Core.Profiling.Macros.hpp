#pragma once

// Requires `import Core;` in the including translation unit.
#define CORE_PROFILE_CONCAT_INNER(a, b) a##b
#define CORE_PROFILE_CONCAT(a, b) CORE_PROFILE_CONCAT_INNER(a, b)

#define PROFILE_SCOPE(name) ::Core::Profiling::ScopedTimer CORE_PROFILE_CONCAT(profileTimer, __LINE__)(name)
#define PROFILE_FUNCTION() PROFILE_SCOPE(__func__)
