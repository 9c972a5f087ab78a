#pragma once

#include <mydiff/common.hpp>

#include <optional>
#include <vector>

#include <sys/types.h> // ssize_t

namespace mydiff {

/*
 * The edit graph for A = a1..aN and B = b1..bM has a vertex at each point
 * (x,y) with x in [0,N] and y in [0,M]. Horizontal edges delete from A,
 * vertical edges insert from B, and a diagonal edge connects (x-1,y-1) to
 * (x,y) wherever ax = by.
 */
struct Point
{
    size_t x, y;

    bool operator==(Point const&) const = default;
};

/*
 * The still-unresolved window [left,right) x [top,bottom) of the edit graph.
 */
struct Box
{
    size_t left, top, right, bottom;

    size_t width() const { return right - left; }
    size_t height() const { return bottom - top; }
    size_t size() const { return width() + height(); }
    ssize_t delta() const { return (ssize_t)width() - (ssize_t)height(); }
};

/*
 * A diagonal run on the shortest path through a box, together with the
 * single non-diagonal edge next to it.
 *
 * A FORWARD snake begins with its non-diagonal edge: start is the point
 * before that edge and finish is the end of the diagonal run.
 * A BACKWARD snake ends with its non-diagonal edge: start is the beginning
 * of the diagonal run and finish is the point after that edge.
 * When the snake was found with no edits at all it is purely diagonal.
 */
struct Snake
{
    enum Direction {
        FORWARD,
        BACKWARD,
    };

    Point start, finish;
    Direction direction;

    bool operator==(Snake const&) const = default;
};

/*
 * Myers' linear-space midpoint search.
 *
 * Frontiers are grown from both corners of a box at once, one edit per
 * round, until a forward path and a backward path overlap on the same
 * diagonal. The overlapping snake is then on some shortest path through
 * the box, and splits it into two strictly smaller boxes.
 */
class EditGraph
{
public:
    EditGraph(ByteView a, ByteView b);

    /*
     * Find the middle snake of box, or nothing if the box is empty.
     */
    std::optional<Snake> midpoint(Box const& box);

private:
    std::optional<Snake> forward_(Box const& box, ssize_t d);
    std::optional<Snake> backward_(Box const& box, ssize_t d);

    // furthest x reached on forward diagonal k = x - y relative to the box
    ssize_t & vf_(ssize_t k) { return vf_storage_[(size_t)(k + offset_)]; }
    // furthest (smallest) y reached on backward diagonal c = k - delta
    ssize_t & vb_(ssize_t c) { return vb_storage_[(size_t)(c + offset_)]; }

    ByteView a_, b_;
    // scratch shared by every midpoint() call; only ever grows
    std::vector<ssize_t> vf_storage_, vb_storage_;
    ssize_t offset_;
};

} // namespace mydiff
