/* The linear space refinement of the O(ND) algorithm from
 * http://www.xmailserver.org/diff2.pdf section 4b.
 */

#include <mydiff/edit_graph.hpp>

#include <stdexcept>

namespace mydiff {

EditGraph::EditGraph(ByteView a, ByteView b)
: a_(a), b_(b), offset_(0)
{ }

std::optional<Snake> EditGraph::midpoint(Box const& box)
{
    if (box.size() == 0) {
        return std::nullopt;
    }

    /*
     * An SES of length D through the box has a forward half of ceil(D/2)
     * edits and a backward half of floor(D/2), and D <= size.
     */
    ssize_t max = (ssize_t)(box.size() + 1) / 2;

    // diagonals -max-1 .. max+1 are addressable
    offset_ = max + 1;
    size_t needed = (size_t)(2 * max + 3);
    if (vf_storage_.size() < needed) {
        vf_storage_.resize(needed);
        vb_storage_.resize(needed);
    }

    vf_(1) = (ssize_t)box.left;
    vb_(1) = (ssize_t)box.bottom;

    for (ssize_t d = 0; d <= max; ++ d) {
        if (auto snake = forward_(box, d)) {
            return snake;
        }
        if (auto snake = backward_(box, d)) {
            return snake;
        }
    }

    // the frontiers always meet by d = ceil(size/2)
    throw std::logic_error("edit graph frontiers did not meet");
}

std::optional<Snake> EditGraph::forward_(Box const& box, ssize_t d)
{
    ssize_t const left = (ssize_t)box.left, top = (ssize_t)box.top;
    ssize_t const right = (ssize_t)box.right, bottom = (ssize_t)box.bottom;
    ssize_t const delta = box.delta();

    for (ssize_t k = -d; k <= d; k += 2) {
        ssize_t c = k - delta;
        ssize_t px, x;

        if (k == -d || (k != d && vf_(k - 1) < vf_(k + 1))) {
            // down from diagonal k+1: insert
            px = x = vf_(k + 1);
        } else {
            // right from diagonal k-1: delete
            px = vf_(k - 1);
            x = px + 1;
        }

        ssize_t y = top + (x - left) - k;
        ssize_t py = (d == 0 || x != px) ? y : y - 1;

        while (x < right && y < bottom && a_[(size_t)x] == b_[(size_t)y]) {
            ++ x; ++ y;
        }

        vf_(k) = x;

        // with odd delta the backward frontier of round d-1 is the one to meet
        if ((delta & 1) && c >= -(d - 1) && c <= d - 1 && y >= vb_(c)) {
            return Snake{
                {(size_t)px, (size_t)py},
                {(size_t)x, (size_t)y},
                Snake::FORWARD
            };
        }
    }

    return std::nullopt;
}

std::optional<Snake> EditGraph::backward_(Box const& box, ssize_t d)
{
    ssize_t const left = (ssize_t)box.left, top = (ssize_t)box.top;
    ssize_t const delta = box.delta();

    for (ssize_t c = -d; c <= d; c += 2) {
        ssize_t k = c + delta;
        ssize_t py, y;

        if (c == -d || (c != d && vb_(c - 1) > vb_(c + 1))) {
            // left from diagonal c+1: delete
            py = y = vb_(c + 1);
        } else {
            // up from diagonal c-1: insert
            py = vb_(c - 1);
            y = py - 1;
        }

        ssize_t x = left + (y - top) + k;
        ssize_t px = (d == 0 || y != py) ? x : x + 1;

        while (x > left && y > top && a_[(size_t)(x - 1)] == b_[(size_t)(y - 1)]) {
            -- x; -- y;
        }

        vb_(c) = y;

        // with even delta the forward frontier of this same round is the one to meet
        if (!(delta & 1) && k >= -d && k <= d && x <= vf_(k)) {
            return Snake{
                {(size_t)x, (size_t)y},
                {(size_t)px, (size_t)py},
                Snake::BACKWARD
            };
        }
    }

    return std::nullopt;
}

} // namespace mydiff
