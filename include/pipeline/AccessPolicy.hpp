#pragma once
#include <string>
#include <vector>
#include "pipeline/ChangeTypes.hpp"

namespace autopatch {

// Hand-tool operations an actor may be granted.
enum class Capability { READ, WRITE, LIST, EXISTS };

const char* to_string(Capability cap);

struct GuardResult {
    bool allowed;
    std::string reason;
};

// Static role table built at startup; never mutated afterwards.
//   PRIVILEGED_ENGINEER: read/write/list/exists on SOURCE and WORKSPACE
//   RESTRICTED_TOOL:     read/write/list/exists on WORKSPACE only
class AccessPolicy {
public:
    static bool may_write(ActorRole role, RootKind root);
    static bool may_read(ActorRole role, RootKind root);
    static bool may_use(ActorRole role, Capability cap, RootKind root);

    static GuardResult check_write(ActorRole role, RootKind root);
    static GuardResult check_capability(ActorRole role, Capability cap, RootKind root);

    static std::vector<RootKind> writable_roots(ActorRole role);
};

}
