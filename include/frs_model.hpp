#pragma once
#include <string>
#include <vector>
#include "polynomial.hpp"

// 前向可达集 (FRS) 模型
// frs_polynomial = I(k, z)，FRS(k) = { z : I(k, z) >= 1 }
// k = (k1 横摆角速度参数, k2 速度参数) ∈ [-1, 1]^2，z 为 FRS 归一化坐标
// 载入后只读，按值传入每次规划调用
struct FrsModel {
    Polynomial frs_polynomial;
    std::vector<std::string> k_vars{"k1", "k2"};
    std::vector<std::string> z_vars{"z1", "z2"};

    double v_min = 0.0;          // 期望速度范围 v_range
    double v_max = 1.5;
    double delta_v = 0.5;        // 单次规划允许的速度变化
    double w_max = 1.0;          // k1 = 1 对应的横摆角速度 (rad/s)
    double distance_scale = 1.0; // D
    double initial_x = 0.0;      // 机器人在 FRS 系中的位置
    double initial_y = 0.0;
    double t_plan = 0.5;         // 规划周期
    double t_f = 1.0;            // FRS 时间跨度

    // 以下均为 k 上的多项式
    Polynomial w_des;            // 期望横摆角速度
    Polynomial v_des;            // 期望速度
    Polynomial x_des;            // t_f 时刻期望位置（FRS 系）
    Polynomial y_des;

    // 变量与数值一致性检查，失败抛 std::invalid_argument
    void validate() const;
};

// 按初始速度区间组织的一组 FRS
class FrsLibrary {
public:
    // 区间 [v0_lo, v0_hi]，两端均包含
    void add(double v0_lo, double v0_hi, FrsModel model);

    // 选取包含 v0 的区间中下界最大的一个（最快可行的 FRS）
    // 无匹配区间抛 std::out_of_range
    const FrsModel& select(double v0) const;

    size_t size() const { return brackets_.size(); }

private:
    struct Bracket {
        double lo;
        double hi;
        FrsModel model;
    };
    std::vector<Bracket> brackets_;
};

// 手写的 Turtlebot FRS 参数
struct TurtlebotFrsParams {
    double speed_limit = 1.5;      // 最大速度 (m/s)
    double delta_v = 0.5;
    double w_max = 1.0;
    double t_plan = 0.5;
    double t_f = 1.0;
    double footprint = 0.175;      // 机身半径 (m)
    double tracking_error = 0.02;  // 跟踪误差裕量 (m)
    double initial_x = -0.5;
    double initial_y = 0.0;
};

// 解析构造 Turtlebot FRS：圆弧轨迹的多项式近似，扫过区域用包含它的圆外包
FrsModel makeTurtlebotFrs(double v0_lo, double v0_hi,
                          const TurtlebotFrsParams& params = TurtlebotFrsParams());

// 三个初始速度区间：[0.0, 0.5], [0.5, 1.0], [1.0, 1.5]
FrsLibrary loadTurtlebotFrsLibrary(const TurtlebotFrsParams& params = TurtlebotFrsParams());
