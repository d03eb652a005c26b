#include "node_census.hpp"
#include <memory>

namespace codegauge::complexity {

NodeCensus take_census(TSNode root, const NodeClassifier& classifier) {
    NodeCensus census;
    if (ts_node_is_null(root)) {
        return census;
    }

    TSTreeCursor cursor = ts_tree_cursor_new(root);
    std::unique_ptr<TSTreeCursor, void(*)(TSTreeCursor*)> guard(&cursor, ts_tree_cursor_delete);

    bool done = false;
    while (!done) {
        ++census.node_count;
        if (classifier.counts_as_control_flow(ts_tree_cursor_current_node(&cursor))) {
            ++census.control_flow_count;
        }

        if (ts_tree_cursor_goto_first_child(&cursor) ||
            ts_tree_cursor_goto_next_sibling(&cursor)) {
            continue;
        }

        // Climb until a sibling exists; back at root means done
        for (;;) {
            if (!ts_tree_cursor_goto_parent(&cursor)) {
                done = true;
                break;
            }
            if (ts_tree_cursor_goto_next_sibling(&cursor)) {
                break;
            }
        }
    }

    return census;
}

} // namespace codegauge::complexity
