//! # Compiler Passes
//!
//! A pass analyzes a tree without modifying it; `PassManager` runs passes in
//! the order they were added.
//!
//! ## Usage
//!
//! ```cpp
//! PassManager pm;
//! pm.add_pass<lint::CheckUnusedPrivateProperties>(compiler);
//! pm.run(root);
//! ```

#pragma once

#include "ast/node.hpp"

#include <memory>
#include <string>
#include <vector>

namespace deadprop::compiler {

// ============================================================================
// Pass Base Class
// ============================================================================

class CompilerPass {
public:
    virtual ~CompilerPass() = default;

    /// Returns the name of this pass for logging.
    [[nodiscard]] virtual auto name() const -> std::string = 0;

    /// Runs the pass over `root`.
    virtual void process(const ast::Node& root) = 0;
};

// ============================================================================
// Pass Manager
// ============================================================================

class PassManager {
public:
    /// Adds a pass to the pipeline.
    template <typename PassT, typename... Args> auto add_pass(Args&&... args) -> PassT& {
        auto pass = std::make_unique<PassT>(std::forward<Args>(args)...);
        PassT& ref = *pass;
        passes_.push_back(std::move(pass));
        return ref;
    }

    /// Runs all passes on `root`. An `InvariantError` raised by a pass is
    /// logged and rethrown; later passes do not run.
    void run(const ast::Node& root);

    [[nodiscard]] auto size() const -> size_t {
        return passes_.size();
    }

private:
    std::vector<std::unique_ptr<CompilerPass>> passes_;
};

} // namespace deadprop::compiler
