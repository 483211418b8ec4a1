#include "polygon.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

static constexpr double kPi = 3.14159265358979323846;

double signedArea(const Polygon& poly) {
    double a = 0.0;
    const size_t n = poly.size();
    for (size_t i = 0; i < n; ++i) {
        a += cross(poly[i], poly[(i + 1) % n]);
    }
    return 0.5 * a;
}

double perimeter(const Polygon& poly) {
    if (poly.size() < 2) return 0.0;
    double L = 0.0;
    for (size_t i = 0; i < poly.size(); ++i) {
        L += norm(sub(poly[(i + 1) % poly.size()], poly[i]));
    }
    return L;
}

Polygon removeDuplicateVertices(const Polygon& poly, double tol) {
    Polygon out;
    for (const auto& p : poly) {
        if (!out.empty() && norm(sub(p, out.back())) <= tol) continue;
        out.push_back(p);
    }
    while (out.size() > 1 && norm(sub(out.front(), out.back())) <= tol) {
        out.pop_back();
    }
    return out;
}

bool pointInPolygon(const Polygon& poly, P2 p) {
    bool inside = false;
    const size_t n = poly.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const P2& a = poly[i];
        const P2& b = poly[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            double x_cross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < x_cross) inside = !inside;
        }
    }
    return inside;
}

// 计算点到线段的最短距离
static double distanceToSegment(P2 p, P2 p1, P2 p2) {
    P2 segment = sub(p2, p1);
    double len2 = dot(segment, segment);
    if (len2 < 1e-18) return norm(sub(p, p1)); // 线段退化为一个点

    double t = dot(sub(p, p1), segment) / len2;
    t = std::clamp(t, 0.0, 1.0);
    return norm(sub(p, add(p1, mul(segment, t))));
}

double distanceToBoundary(const Polygon& poly, P2 p) {
    if (poly.empty()) return INFINITY;
    if (poly.size() == 1) return norm(sub(p, poly[0]));
    double d = INFINITY;
    for (size_t i = 0; i < poly.size(); ++i) {
        d = std::min(d, distanceToSegment(p, poly[i], poly[(i + 1) % poly.size()]));
    }
    return d;
}

// 线段 a-b 外扩 b 得到的矩形（逆时针）
static Polygon bufferSegment(P2 a, P2 c, double b) {
    P2 d = sub(c, a);
    double len = norm(d);
    P2 u = mul(d, 1.0 / len);
    P2 n = {-u.y, u.x};
    return {
        add(sub(a, mul(u, b)), mul(n, -b)),
        add(add(c, mul(u, b)), mul(n, -b)),
        add(add(c, mul(u, b)), mul(n, b)),
        add(sub(a, mul(u, b)), mul(n, b)),
    };
}

Polygon bufferPolygon(const Polygon& poly, double b) {
    if (b < 0.0) {
        throw std::invalid_argument("bufferPolygon: buffer must be non-negative");
    }
    Polygon q = removeDuplicateVertices(poly);
    if (q.empty()) return {};

    // 退化：单点 -> 正方形
    if (q.size() == 1) {
        P2 c = q[0];
        return {{c.x - b, c.y - b}, {c.x + b, c.y - b},
                {c.x + b, c.y + b}, {c.x - b, c.y + b}};
    }

    double area = signedArea(q);
    // 退化：线段或共线点 -> 取最远两点构成的线段
    if (q.size() == 2 || std::abs(area) < 1e-12) {
        size_t i0 = 0, i1 = 0;
        double best = -1.0;
        for (size_t i = 0; i < q.size(); ++i) {
            double d = norm(sub(q[i], q[0]));
            if (d > best) { best = d; i1 = i; }
        }
        best = -1.0;
        for (size_t i = 0; i < q.size(); ++i) {
            double d = norm(sub(q[i], q[i1]));
            if (d > best) { best = d; i0 = i; }
        }
        return bufferSegment(q[i0], q[i1], b);
    }

    const double orient = area > 0.0 ? 1.0 : -1.0;
    const size_t n = q.size();

    // 每条边 i: q[i] -> q[i+1] 的单位方向与外法向
    std::vector<P2> dir(n), nrm(n);
    for (size_t i = 0; i < n; ++i) {
        P2 d = sub(q[(i + 1) % n], q[i]);
        dir[i] = mul(d, 1.0 / norm(d));
        nrm[i] = mul(P2{dir[i].y, -dir[i].x}, orient);
    }

    Polygon out;
    out.reserve(2 * n);
    for (size_t i = 0; i < n; ++i) {
        const size_t prev = (i + n - 1) % n;
        const P2 n0 = nrm[prev];
        const P2 n1 = nrm[i];
        const double c = 1.0 + dot(n0, n1);
        const bool convex = orient * cross(dir[prev], dir[i]) > 0.0;

        if (c > 0.5 || (!convex && c > 1e-9)) {
            // 斜接：两条偏移直线的交点
            out.push_back(add(q[i], mul(add(n0, n1), b / c)));
        } else if (convex) {
            // 过尖的凸角：两条偏移边各延长 b 后截平
            out.push_back(add(q[i], add(mul(n0, b), mul(dir[prev], b))));
            out.push_back(add(q[i], sub(mul(n1, b), mul(dir[i], b))));
        } else {
            // 折返：直接使用两侧偏移点
            out.push_back(add(q[i], mul(n0, b)));
            out.push_back(add(q[i], mul(n1, b)));
        }
    }
    return out;
}

Eigen::Matrix2Xd interpolatePolygon(const Polygon& poly, double spacing) {
    if (!(spacing > 0.0)) {
        throw std::invalid_argument("interpolatePolygon: spacing must be positive");
    }
    Polygon q = removeDuplicateVertices(poly);
    if (q.empty()) return Eigen::Matrix2Xd(2, 0);

    const double L = perimeter(q);
    if (q.size() == 1 || L < 1e-12) {
        Eigen::Matrix2Xd single(2, 1);
        single << q[0].x, q[0].y;
        return single;
    }

    const int N = std::max(1, static_cast<int>(std::ceil(L / spacing - 1e-9)));
    const double ds = L / N;

    Eigen::Matrix2Xd pts(2, N + 1);
    size_t edge = 0;
    double edge_start = 0.0; // 当前边起点处的累计弧长
    double edge_len = norm(sub(q[1 % q.size()], q[0]));
    for (int i = 0; i < N; ++i) {
        const double s = i * ds;
        while (s > edge_start + edge_len && edge + 1 < q.size()) {
            edge_start += edge_len;
            ++edge;
            edge_len = norm(sub(q[(edge + 1) % q.size()], q[edge]));
        }
        const P2 a = q[edge];
        const P2 c = q[(edge + 1) % q.size()];
        const double t = edge_len > 0.0 ? std::clamp((s - edge_start) / edge_len, 0.0, 1.0) : 0.0;
        const P2 p = add(a, mul(sub(c, a), t));
        pts(0, i) = p.x;
        pts(1, i) = p.y;
    }
    // 闭合
    pts.col(N) = pts.col(0);
    return pts;
}

Polygon makeRandomPolygon(int N, P2 center, double scale, unsigned int seed) {
    if (N < 3) {
        throw std::invalid_argument("makeRandomPolygon: need at least 3 vertices");
    }
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> angle_dist(0.0, 2.0 * kPi);
    std::uniform_real_distribution<double> radius_dist(0.5, 1.0);

    std::vector<double> angles(N);
    for (auto& a : angles) a = angle_dist(rng);
    std::sort(angles.begin(), angles.end());

    Polygon poly;
    poly.reserve(N);
    for (double a : angles) {
        double r = 0.5 * scale * radius_dist(rng);
        poly.push_back({center.x + r * std::cos(a), center.y + r * std::sin(a)});
    }
    return poly;
}
