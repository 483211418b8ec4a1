#include "frs_model.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

static void requireVariables(const Polynomial& p, const std::vector<std::string>& vars,
                             const std::string& what) {
    if (p.variables() != vars) {
        throw std::invalid_argument("FrsModel: " + what + " must be a polynomial in the trajectory parameters");
    }
}

void FrsModel::validate() const {
    if (k_vars.empty() || z_vars.empty()) {
        throw std::invalid_argument("FrsModel: empty variable group");
    }
    // I(k, z) 的变量必须恰好是 k_vars ∪ z_vars
    const auto& vars = frs_polynomial.variables();
    if (vars.size() != k_vars.size() + z_vars.size()) {
        throw std::invalid_argument("FrsModel: FRS polynomial has unexpected variables");
    }
    for (const auto& name : k_vars) {
        if (frs_polynomial.indexOf(name) < 0) {
            throw std::invalid_argument("FrsModel: FRS polynomial missing variable " + name);
        }
    }
    for (const auto& name : z_vars) {
        if (frs_polynomial.indexOf(name) < 0) {
            throw std::invalid_argument("FrsModel: FRS polynomial missing variable " + name);
        }
    }
    requireVariables(w_des, k_vars, "w_des");
    requireVariables(v_des, k_vars, "v_des");
    requireVariables(x_des, k_vars, "x_des");
    requireVariables(y_des, k_vars, "y_des");

    if (!(distance_scale > 0.0)) {
        throw std::invalid_argument("FrsModel: distance scale must be positive");
    }
    if (!(v_min <= v_max) || v_max <= 0.0) {
        throw std::invalid_argument("FrsModel: invalid speed range");
    }
    if (delta_v < 0.0 || t_plan <= 0.0 || t_f < t_plan) {
        throw std::invalid_argument("FrsModel: invalid timing or delta_v");
    }
}

void FrsLibrary::add(double v0_lo, double v0_hi, FrsModel model) {
    if (v0_lo > v0_hi) {
        throw std::invalid_argument("FrsLibrary: empty initial speed bracket");
    }
    model.validate();
    brackets_.push_back({v0_lo, v0_hi, std::move(model)});
}

const FrsModel& FrsLibrary::select(double v0) const {
    const Bracket* best = nullptr;
    for (const auto& b : brackets_) {
        if (v0 >= b.lo && v0 <= b.hi && (best == nullptr || b.lo > best->lo)) {
            best = &b;
        }
    }
    if (best == nullptr) {
        throw std::out_of_range("FrsLibrary: no FRS for initial speed " + std::to_string(v0) + " m/s");
    }
    std::cout << "[FRS] 选用初始速度区间 [" << best->lo << ", " << best->hi << "] m/s\n";
    return best->model;
}

FrsModel makeTurtlebotFrs(double v0_lo, double v0_hi, const TurtlebotFrsParams& params) {
    const std::vector<std::string> vars = {"k1", "k2", "z1", "z2"};
    const std::vector<std::string> k_vars = {"k1", "k2"};
    const std::vector<std::string> z_vars = {"z1", "z2"};

    FrsModel frs;
    frs.v_min = std::max(0.0, v0_lo - params.delta_v);
    frs.v_max = std::min(params.speed_limit, v0_hi + params.delta_v);
    frs.delta_v = params.delta_v;
    frs.w_max = params.w_max;
    frs.t_plan = params.t_plan;
    frs.t_f = params.t_f;
    frs.initial_x = params.initial_x;
    frs.initial_y = params.initial_y;

    const double margin = params.footprint + params.tracking_error;
    const double D = frs.v_max * params.t_f + margin;
    frs.distance_scale = D;

    Polynomial k1 = Polynomial::variable(vars, "k1");
    Polynomial k2 = Polynomial::variable(vars, "k2");
    Polynomial z1 = Polynomial::variable(vars, "z1");
    Polynomial z2 = Polynomial::variable(vars, "z2");

    // v = v_max/2 (k2 + 1)，w = w_max k1
    Polynomial v = (frs.v_max / 2.0) * (k2 + 1.0);
    Polynomial w = params.w_max * k1;

    // 归一化行驶距离与航向变化
    Polynomial len = v * (params.t_f / D);
    Polynomial psi = w * params.t_f;

    // 圆弧终点的小角度近似：弦长 ≈ len (1 - psi^2/6)，横向 ≈ len psi / 2
    Polynomial chord = len * (1.0 - psi.pow(2) * (1.0 / 6.0));
    Polynomial x_end = chord + params.initial_x;
    Polynomial y_end = len * psi * 0.5 + params.initial_y;

    // 扫过区域外包圆：圆心为弦中点，半径覆盖半弦长 + 拱高 + 机身
    Polynomial cx = chord * 0.5 + params.initial_x;
    Polynomial cy = len * psi * 0.25 + params.initial_y;
    Polynomial rho = len * 0.65 + margin / D;

    frs.frs_polynomial = 1.0 + rho.pow(2) - (z1 - cx).pow(2) - (z2 - cy).pow(2);
    frs.k_vars = k_vars;
    frs.z_vars = z_vars;

    // 去掉 z 变量得到 k 上的多项式
    const Eigen::VectorXd z0 = Eigen::VectorXd::Zero(2);
    frs.w_des = w.substitute(z_vars, z0);
    frs.v_des = v.substitute(z_vars, z0);
    frs.x_des = x_end.substitute(z_vars, z0);
    frs.y_des = y_end.substitute(z_vars, z0);

    frs.validate();
    return frs;
}

FrsLibrary loadTurtlebotFrsLibrary(const TurtlebotFrsParams& params) {
    FrsLibrary lib;
    lib.add(0.0, 0.5, makeTurtlebotFrs(0.0, 0.5, params));
    lib.add(0.5, 1.0, makeTurtlebotFrs(0.5, 1.0, params));
    lib.add(1.0, 1.5, makeTurtlebotFrs(1.0, 1.5, params));
    return lib;
}
