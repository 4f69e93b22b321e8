#ifndef QUILTBLOCK_HISTORY_UNDO_MANAGER_HPP
#define QUILTBLOCK_HISTORY_UNDO_MANAGER_HPP

#include "operation.hpp"
#include "pattern_operation.hpp"
#include <deque>
#include <model/constants.hpp>
#include <optional>

namespace quiltblock {

// Bounded undo/redo stacks of recorded operations. The manager never
// applies anything: undo() hands back the inverse to apply, redo() the
// original operation. Instantiated for block and pattern operations.
template <typename Op>
class BasicUndoManager {
public:
    explicit BasicUndoManager(size_t max_history = constants::MAX_UNDO_HISTORY);

    // Push a just-applied operation. Drops the oldest entry when full and
    // clears the redo stack.
    void record(Op operation);

    std::optional<Op> undo();
    std::optional<Op> redo();

    bool can_undo() const { return !undo_stack_.empty(); }
    bool can_redo() const { return !redo_stack_.empty(); }

    size_t undo_size() const { return undo_stack_.size(); }
    size_t redo_size() const { return redo_stack_.size(); }
    size_t max_history() const { return max_history_; }

    // Oldest first
    const std::deque<Op>& undo_stack() const { return undo_stack_; }
    const std::deque<Op>& redo_stack() const { return redo_stack_; }

    void clear();

private:
    size_t max_history_;
    std::deque<Op> undo_stack_;
    std::deque<Op> redo_stack_;
};

extern template class BasicUndoManager<Operation>;
extern template class BasicUndoManager<PatternOperation>;

using UndoManager = BasicUndoManager<Operation>;
using PatternUndoManager = BasicUndoManager<PatternOperation>;

}  // namespace quiltblock

#endif // QUILTBLOCK_HISTORY_UNDO_MANAGER_HPP
