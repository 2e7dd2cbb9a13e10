/// \file worktree_pool.hpp \brief Fixed set of working tree checkouts
/// shared by the commit workers

#ifndef WORKTREE_POOL_HPP
#define WORKTREE_POOL_HPP

#include <mutex>

#include "errors.hpp"
#include "program_state.hpp"
#include "vcs_oracle.hpp"

/// \brief Single reusable working tree location
struct WorktreeSlot {
    int  index;
    Path path;
    /// Commit currently reflected by the tree, empty if the tree is in
    /// unknown state after failed checkout.
    Str commit;
    /// Held for the whole checkout + analysis window of a commit
    std::mutex checkout_mutex;
};

/// \brief Exclusive access to one slot, released on destruction
class SlotLease {
  public:
    SlotLease(WorktreeSlot& _slot)
        : slot(&_slot), lock(_slot.checkout_mutex) {}

    WorktreeSlot* operator->() const { return slot; }
    WorktreeSlot& get() const { return *slot; }

  private:
    WorktreeSlot*                slot;
    std::unique_lock<std::mutex> lock;
};

class WorktreePool {
  public:
    /// \arg size slots are created under \arg root by `init`
    WorktreePool(
        VcsOracle&       vcs,
        CR<Path>         root,
        int              size,
        CR<RetryPolicy>  checkout_retry,
        SPtr<Logger>     logger);

    /// Calls `shutdown` if it was not done explicitly
    ~WorktreePool();

    WorktreePool(WorktreePool const&)            = delete;
    WorktreePool& operator=(WorktreePool const&) = delete;

    /// Remove stale slot directories left by previous runs and create
    /// fresh slots pinned to \arg initial_commit. Throws `setup_error`.
    void init(CR<Str> initial_commit);

    /// Get exclusive use of the slot for one commit processing
    auto acquire(int slot_index) -> SlotLease;

    /// Overwrite slot tree with \arg commit content. Stale lock artifacts
    /// are removed between attempts. Throws `checkout_error` when retries
    /// are exhausted.
    void checkout(SlotLease& lease, CR<Str> commit);

    /// Discard partial artifacts in the slot tree. Returns false if the
    /// slot could not be cleaned.
    bool reset(SlotLease& lease);

    /// Deregister every slot and remove its directory
    void shutdown();

    int  size() const { return static_cast<int>(slots.size()); }
    auto slot_path(int slot_index) const -> Path;

  private:
    void remove_slot_dir(CR<Path> path);

    VcsOracle&              vcs;
    Path                    root;
    int                     requested;
    RetryPolicy             retry;
    Vec<UPtr<WorktreeSlot>> slots;
    bool                    active = false;
    SPtr<Logger>            logger;
};

#endif // WORKTREE_POOL_HPP
