#include <mydiff/diff.hpp>
#include <mydiff/edit_graph.hpp>

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace mydiff {

std::uint64_t position(DiffOp const& op)
{
    return std::visit([](auto const& o) { return o.position; }, op);
}

std::uint64_t & position(DiffOp & op)
{
    return std::visit([](auto & o) -> std::uint64_t & { return o.position; }, op);
}

std::uint64_t consumed(DiffOp const& op)
{
    return std::visit(overloaded{
        [](Insert const&) -> std::uint64_t { return 0; },
        [](Delete const& del) -> std::uint64_t { return del.length; },
        [](Change const& chg) -> std::uint64_t { return chg.payload.size(); },
    }, op);
}

std::uint64_t produced(DiffOp const& op)
{
    return std::visit(overloaded{
        [](Insert const& ins) -> std::uint64_t { return ins.payload.size(); },
        [](Delete const&) -> std::uint64_t { return 0; },
        [](Change const& chg) -> std::uint64_t { return chg.payload.size(); },
    }, op);
}

std::uint64_t edit_length(DiffOp const& op)
{
    return std::visit(overloaded{
        [](Insert const& ins) -> std::uint64_t { return ins.payload.size(); },
        [](Delete const& del) -> std::uint64_t { return del.length; },
        // one deletion and one insertion per byte
        [](Change const& chg) -> std::uint64_t { return 2 * chg.payload.size(); },
    }, op);
}

std::uint64_t edit_length(std::span<DiffOp const> ops)
{
    std::uint64_t total = 0;
    for (auto const& op : ops) {
        total += edit_length(op);
    }
    return total;
}

namespace {

/*
 * The non-diagonal edge of a snake as an edit, if it has one.
 *
 * A forward snake's edge leaves its start point; a backward snake's edge
 * arrives at its finish point.
 */
std::optional<DiffOp> snake_edit(Snake const& snake, ByteView new_)
{
    auto const& [start, finish, direction] = snake;
    size_t dx = finish.x - start.x;
    size_t dy = finish.y - start.y;

    if (dx == dy) {
        return std::nullopt;
    }

    if (direction == Snake::FORWARD) {
        if (dy > dx) {
            return Insert{start.x, Bytes{new_[start.y]}};
        } else {
            return Delete{start.x, 1};
        }
    } else {
        if (dy > dx) {
            return Insert{finish.x, Bytes{new_[finish.y - 1]}};
        } else {
            return Delete{finish.x - 1, 1};
        }
    }
}

void append(Bytes & bytes, Bytes const& tail)
{
    bytes.insert(bytes.end(), tail.begin(), tail.end());
}

/*
 * Replace `length` source bytes at `pos` with `payload`, as a Change of the
 * common span followed by whatever remains of the longer side.
 */
void fuse(std::vector<DiffOp> & out, std::uint64_t pos, std::uint64_t length, Bytes payload)
{
    std::uint64_t common = std::min<std::uint64_t>(length, payload.size());

    if (common > 0) {
        out.emplace_back(Change{pos, Bytes(payload.begin(), payload.begin() + (ssize_t)common)});
    }
    if (length > common) {
        out.emplace_back(Delete{pos + common, length - common});
    } else if (payload.size() > common) {
        out.emplace_back(Insert{pos + length, Bytes(payload.begin() + (ssize_t)common, payload.end())});
    }
}

} // namespace

std::vector<DiffOp> ScriptBuilder::primitives(ByteView old_, ByteView new_)
{
    std::vector<DiffOp> ops;
    EditGraph graph(old_, new_);

    // pending work, last in first out, so that positions come out ascending:
    // each box is replaced by its pre-snake box, its edit, its post-snake box
    std::vector<std::variant<Box, DiffOp>> work;
    work.emplace_back(Box{0, 0, old_.size(), new_.size()});

    while (!work.empty()) {
        auto item = std::move(work.back());
        work.pop_back();

        if (auto * op = std::get_if<DiffOp>(&item)) {
            ops.emplace_back(std::move(*op));
            continue;
        }

        Box const& box = std::get<Box>(item);

        if (box.width() == 0) {
            if (box.height() > 0) {
                ops.emplace_back(Insert{
                    box.left,
                    Bytes(new_.begin() + (ssize_t)box.top, new_.begin() + (ssize_t)box.bottom)
                });
            }
            continue;
        }
        if (box.height() == 0) {
            ops.emplace_back(Delete{box.left, box.width()});
            continue;
        }

        // box is non-empty, so there is always a snake
        Snake snake = *graph.midpoint(box);
        Box before{box.left, box.top, snake.start.x, snake.start.y};

        work.emplace_back(Box{snake.finish.x, snake.finish.y, box.right, box.bottom});
        if (auto edit = snake_edit(snake, new_)) {
            work.emplace_back(std::move(*edit));
        }
        work.emplace_back(before);
    }

    return ops;
}

std::vector<DiffOp> ScriptBuilder::merge(std::vector<DiffOp> ops)
{
    std::vector<DiffOp> out;
    out.reserve(ops.size());

    for (auto & op : ops) {
        if (!out.empty()) {
            auto & prev = out.back();
            auto * prev_ins = std::get_if<Insert>(&prev);
            auto * ins = std::get_if<Insert>(&op);
            if (prev_ins && ins && prev_ins->position == ins->position) {
                append(prev_ins->payload, ins->payload);
                continue;
            }
            auto * prev_del = std::get_if<Delete>(&prev);
            auto * del = std::get_if<Delete>(&op);
            if (prev_del && del && prev_del->position + prev_del->length == del->position) {
                prev_del->length += del->length;
                continue;
            }
        }
        out.emplace_back(std::move(op));
    }

    return out;
}

std::vector<DiffOp> ScriptBuilder::consolidate(std::vector<DiffOp> ops)
{
    std::vector<DiffOp> out;
    out.reserve(ops.size());

    for (auto & op : ops) {
        if (!out.empty()) {
            auto & prev = out.back();

            // insert before byte p, then delete from byte p
            auto * prev_ins = std::get_if<Insert>(&prev);
            auto * del = std::get_if<Delete>(&op);
            if (prev_ins && del && prev_ins->position == del->position) {
                Bytes payload = std::move(prev_ins->payload);
                out.pop_back();
                fuse(out, del->position, del->length, std::move(payload));
                continue;
            }

            // delete from byte p, then insert at p or right after the deleted span
            auto * prev_del = std::get_if<Delete>(&prev);
            auto * ins = std::get_if<Insert>(&op);
            if (prev_del && ins && (
                    ins->position == prev_del->position ||
                    ins->position == prev_del->position + prev_del->length)) {
                Delete deleted = *prev_del;
                out.pop_back();
                fuse(out, deleted.position, deleted.length, std::move(ins->payload));
                continue;
            }
        }
        out.emplace_back(std::move(op));
    }

    return out;
}

std::vector<DiffOp> ScriptBuilder::build(ByteView old_, ByteView new_)
{
    return consolidate(merge(primitives(old_, new_)));
}

std::uint64_t ses(ByteView old_, ByteView new_)
{
    return edit_length(ScriptBuilder::build(old_, new_));
}

Bytes patch(ByteView old_, std::span<DiffOp const> ops)
{
    Bytes result;
    std::uint64_t cursor = 0;

    for (auto const& op : ops) {
        std::uint64_t pos = position(op);
        if (pos < cursor) {
            throw std::invalid_argument(
                "edit at " + std::to_string(pos) +
                " overlaps or precedes source offset " + std::to_string(cursor));
        }
        if (pos + consumed(op) > old_.size()) {
            throw std::invalid_argument(
                "edit at " + std::to_string(pos) +
                " reaches past the end of a " + std::to_string(old_.size()) + " byte source");
        }

        result.insert(result.end(), old_.begin() + (ssize_t)cursor, old_.begin() + (ssize_t)pos);
        cursor = pos;

        std::visit(overloaded{
            [&](Insert const& ins) {
                append(result, ins.payload);
            },
            [&](Delete const& del) {
                cursor += del.length;
            },
            [&](Change const& chg) {
                append(result, chg.payload);
                cursor += chg.payload.size();
            },
        }, op);
    }

    result.insert(result.end(), old_.begin() + (ssize_t)cursor, old_.end());
    return result;
}

} // namespace mydiff
