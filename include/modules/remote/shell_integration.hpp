#pragma once

#include "cmdpipe/cmdpipe.hpp"

namespace cmdpipe::modules::remote {

// OS shell integration (file-manager context-menu entries).
// Both requests report success; failures are not exceptional.
class ShellIntegration {
public:
    virtual ~ShellIntegration() = default;

    virtual bool register_entries() = 0;
    virtual bool unregister_entries() = 0;
};

} // namespace cmdpipe::modules::remote
