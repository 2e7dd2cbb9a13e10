/// \file change_resolver.hpp \brief Selection of the files that need
/// fingerprinting for the commit

#ifndef CHANGE_RESOLVER_HPP
#define CHANGE_RESOLVER_HPP

#include "commit_ir.hpp"
#include "program_state.hpp"
#include "vcs_oracle.hpp"

class ChangeResolver {
  public:
    ChangeResolver(
        VcsOracle&       vcs,
        CP<miner_config> config,
        SPtr<Logger>     logger);

    /// \brief Files of \arg target that changed since \arg base in the
    /// same lineage. Without \arg base every eligible file in the \arg
    /// root tree is returned and the result is marked as full scan.
    ///
    /// Changed paths that are not present in the \arg root are logged and
    /// dropped. If the difference cannot be computed the resolver falls
    /// back to the full scan.
    auto resolve(CR<Path> root, CR<Opt<Str>> base, CR<Str> target)
        -> ir::ChangeSet;

    /// \brief All eligible files in the working tree, relative to \arg
    /// root. Hidden directories (including `.git`) are not visited.
    auto full_scan(CR<Path> root) const -> ir::ChangeSet;

  private:
    VcsOracle&       vcs;
    CP<miner_config> config;
    SPtr<Logger>     logger;
};

#endif // CHANGE_RESOLVER_HPP
