#include <cmath>
#include <ostream>

#include <wslfp/common_types.hpp>

namespace wslfp {

point operator+(const point& a, const point& b) {
    return {a.x+b.x, a.y+b.y, a.z+b.z};
}

point operator-(const point& a, const point& b) {
    return {a.x-b.x, a.y-b.y, a.z-b.z};
}

point operator*(double s, const point& p) {
    return {s*p.x, s*p.y, s*p.z};
}

double dot(const point& a, const point& b) {
    return a.x*b.x + a.y*b.y + a.z*b.z;
}

double norm(const point& p) {
    return std::sqrt(dot(p, p));
}

std::ostream& operator<<(std::ostream& o, const point& p) {
    return o << "(point " << p.x << ' ' << p.y << ' ' << p.z << ')';
}

} // namespace wslfp
