#pragma once

namespace slate {

// Canvas-space position of a block's origin
struct Point {
    double x = 0;
    double y = 0;

    bool operator==(const Point&) const = default;
};

// Canvas-space block size
struct Extent {
    double width = 0;
    double height = 0;

    bool operator==(const Extent&) const = default;
};

} // namespace slate
