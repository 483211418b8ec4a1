#pragma once
#include <cmath>
#include <vector>
#include <Eigen/Dense>

// 2D 浮点数点
struct P2 {
    double x, y;
};

// 顶点按顺序排列的简单多边形（首尾不重复）
using Polygon = std::vector<P2>;

// -----------------------------------------------------------
// 数学辅助函数
// -----------------------------------------------------------

// 向量点积
inline double dot(P2 a, P2 b) {
    return a.x * b.x + a.y * b.y;
}

// 二维叉积 (z 分量)
inline double cross(P2 a, P2 b) {
    return a.x * b.y - a.y * b.x;
}

// 向量减法
inline P2 sub(P2 a, P2 b) {
    return {a.x - b.x, a.y - b.y};
}

// 向量加法
inline P2 add(P2 a, P2 b) {
    return {a.x + b.x, a.y + b.y};
}

// 向量乘标量
inline P2 mul(P2 a, double s) {
    return {a.x * s, a.y * s};
}

inline double norm(P2 a) {
    return std::sqrt(dot(a, a));
}

// -----------------------------------------------------------
// 多边形工具
// -----------------------------------------------------------

// 有向面积，逆时针为正
double signedArea(const Polygon& poly);

// 闭合边界周长
double perimeter(const Polygon& poly);

// 删除相邻重复顶点（含首尾重复）
Polygon removeDuplicateVertices(const Polygon& poly, double tol = 1e-9);

// 射线法判断点是否在多边形内部
bool pointInPolygon(const Polygon& poly, P2 p);

// 点到多边形边界的最短距离
double distanceToBoundary(const Polygon& poly, P2 p);

// 沿每条边外法向偏移 b（斜接，过尖的角切成两点）
// 凹角处产生的自交保持原样；退化为点/线段时分别生成正方形/矩形
Polygon bufferPolygon(const Polygon& poly, double b);

// 沿闭合边界按弧长均匀采样：N = ceil(L / spacing) 段，返回 N + 1 个点，末点与首点重合
Eigen::Matrix2Xd interpolatePolygon(const Polygon& poly, double spacing);

// 在 center 附近随机生成 N 个顶点的星形多边形（逆时针）
Polygon makeRandomPolygon(int N, P2 center, double scale, unsigned int seed);

