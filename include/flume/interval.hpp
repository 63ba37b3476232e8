#ifndef FLUME_INTERVAL_HEADER
#define FLUME_INTERVAL_HEADER

namespace flume {

/** A half-open [begin, end) range, most often of piece indices. */
struct interval
{
    int begin = 0;
    int end = 0;

    interval() = default;
    interval(int begin_, int end_) : begin(begin_), end(end_) {}

    bool empty() const noexcept { return length() <= 0; }

    int length() const noexcept { return end - begin; }

    bool contains(const int i) const noexcept { return (i >= begin) && (i < end); }

    bool contains(const interval& other) const noexcept
    {
        return (other.begin >= begin) && (other.end <= end);
    }
};

inline bool operator==(const interval& a, const interval& b) noexcept
{
    return (a.begin == b.begin) && (a.end == b.end);
}

inline bool operator!=(const interval& a, const interval& b) noexcept
{
    return !(a == b);
}

} // namespace flume

#endif // FLUME_INTERVAL_HEADER
