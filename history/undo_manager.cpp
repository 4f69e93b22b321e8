#include "undo_manager.hpp"
#include <common/logging.hpp>

namespace quiltblock {

template <typename Op>
BasicUndoManager<Op>::BasicUndoManager(size_t max_history)
    : max_history_(max_history == 0 ? 1 : max_history) {}

template <typename Op>
void BasicUndoManager<Op>::record(Op operation) {
    auto log = logging::get_logger();
    log->debug("Record {} (undo depth {})", operation_type(operation), undo_stack_.size() + 1);

    while (undo_stack_.size() >= max_history_) {
        undo_stack_.pop_front();
    }
    undo_stack_.push_back(std::move(operation));
    redo_stack_.clear();
}

template <typename Op>
std::optional<Op> BasicUndoManager<Op>::undo() {
    if (undo_stack_.empty()) {
        return std::nullopt;
    }

    Op operation = std::move(undo_stack_.back());
    undo_stack_.pop_back();
    Op inverse = invert_operation(operation);
    redo_stack_.push_back(std::move(operation));
    return inverse;
}

template <typename Op>
std::optional<Op> BasicUndoManager<Op>::redo() {
    if (redo_stack_.empty()) {
        return std::nullopt;
    }

    Op operation = std::move(redo_stack_.back());
    redo_stack_.pop_back();
    undo_stack_.push_back(operation);
    return operation;
}

template <typename Op>
void BasicUndoManager<Op>::clear() {
    undo_stack_.clear();
    redo_stack_.clear();
}

template class BasicUndoManager<Operation>;
template class BasicUndoManager<PatternOperation>;

}  // namespace quiltblock
