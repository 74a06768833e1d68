#include "pipeline/AccessPolicy.hpp"

namespace autopatch {

namespace {

struct PolicyEntry {
    ActorRole role;
    RootKind root;
    bool read;
    bool write;
    bool list;
    bool exists;
};

// The privileged engineer is the only role allowed to touch the source tree.
constexpr PolicyEntry kPolicyTable[] = {
    {ActorRole::PRIVILEGED_ENGINEER, RootKind::SOURCE,    true,  true,  true,  true},
    {ActorRole::PRIVILEGED_ENGINEER, RootKind::WORKSPACE, true,  true,  true,  true},
    {ActorRole::RESTRICTED_TOOL,     RootKind::WORKSPACE, true,  true,  true,  true},
};

const PolicyEntry* find_entry(ActorRole role, RootKind root) {
    for (const auto& e : kPolicyTable) {
        if (e.role == role && e.root == root) return &e;
    }
    return nullptr;
}

}

const char* to_string(Capability cap) {
    switch (cap) {
        case Capability::READ: return "read";
        case Capability::WRITE: return "write";
        case Capability::LIST: return "list";
        case Capability::EXISTS: return "exists";
    }
    return "unknown";
}

bool AccessPolicy::may_use(ActorRole role, Capability cap, RootKind root) {
    const PolicyEntry* e = find_entry(role, root);
    if (!e) return false;
    switch (cap) {
        case Capability::READ: return e->read;
        case Capability::WRITE: return e->write;
        case Capability::LIST: return e->list;
        case Capability::EXISTS: return e->exists;
    }
    return false;
}

bool AccessPolicy::may_write(ActorRole role, RootKind root) {
    return may_use(role, Capability::WRITE, root);
}

bool AccessPolicy::may_read(ActorRole role, RootKind root) {
    return may_use(role, Capability::READ, root);
}

GuardResult AccessPolicy::check_write(ActorRole role, RootKind root) {
    return check_capability(role, Capability::WRITE, root);
}

GuardResult AccessPolicy::check_capability(ActorRole role, Capability cap, RootKind root) {
    if (may_use(role, cap, root)) {
        return {true, "Authorized"};
    }
    return {false, std::string("BLOCKED: role '") + to_string(role) + "' may not " +
                   to_string(cap) + " in the " + to_string(root) + " root"};
}

std::vector<RootKind> AccessPolicy::writable_roots(ActorRole role) {
    std::vector<RootKind> roots;
    for (const auto& e : kPolicyTable) {
        if (e.role == role && e.write) roots.push_back(e.root);
    }
    return roots;
}

}
