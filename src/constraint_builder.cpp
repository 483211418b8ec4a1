#include "constraint_builder.hpp"
#include <map>
#include <stdexcept>

static std::vector<int> variableIndices(const Polynomial& poly, const std::vector<std::string>& names) {
    std::vector<int> idx;
    idx.reserve(names.size());
    for (const auto& name : names) {
        int i = poly.indexOf(name);
        if (i < 0) {
            throw std::invalid_argument("decompose: polynomial has no variable " + name);
        }
        idx.push_back(i);
    }
    return idx;
}

FrsPolynomialStructure decompose(const Polynomial& poly,
                                 const std::vector<std::string>& state_vars,
                                 const std::vector<std::string>& param_vars) {
    if (static_cast<int>(state_vars.size() + param_vars.size()) != poly.numVariables()) {
        throw std::invalid_argument("decompose: variable groups do not cover the polynomial");
    }
    const std::vector<int> z_idx = variableIndices(poly, state_vars);
    const std::vector<int> k_idx = variableIndices(poly, param_vars);

    // 指数模式 -> 行/列号（std::map 保证顺序确定）
    std::map<std::vector<int>, int> z_rows, k_cols;
    std::vector<std::vector<int>> z_pat(poly.terms().size()), k_pat(poly.terms().size());
    for (size_t t = 0; t < poly.terms().size(); ++t) {
        const auto& e = poly.terms()[t].exps;
        for (int i : z_idx) z_pat[t].push_back(e[i]);
        for (int i : k_idx) k_pat[t].push_back(e[i]);
        z_rows.emplace(z_pat[t], 0);
        k_cols.emplace(k_pat[t], 0);
    }

    FrsPolynomialStructure s;
    s.state_vars = state_vars;
    s.param_vars = param_vars;
    s.state_exps.resize(z_rows.size(), state_vars.size());
    s.param_exps.resize(k_cols.size(), param_vars.size());

    int r = 0;
    for (auto& kv : z_rows) {
        kv.second = r;
        for (size_t j = 0; j < kv.first.size(); ++j) s.state_exps(r, j) = kv.first[j];
        ++r;
    }
    int c = 0;
    for (auto& kv : k_cols) {
        kv.second = c;
        for (size_t j = 0; j < kv.first.size(); ++j) s.param_exps(c, j) = kv.first[j];
        ++c;
    }

    s.coeffs = Eigen::MatrixXd::Zero(z_rows.size(), k_cols.size());
    for (size_t t = 0; t < poly.terms().size(); ++t) {
        s.coeffs(z_rows[z_pat[t]], k_cols[k_pat[t]]) += poly.terms()[t].coeff;
    }
    return s;
}

std::vector<Polynomial> evaluateOnPoints(const FrsPolynomialStructure& structure,
                                         const Eigen::MatrixXd& points) {
    const int n_z = static_cast<int>(structure.state_vars.size());
    if (points.cols() > 0 && points.rows() != n_z) {
        throw std::invalid_argument("evaluateOnPoints: point dimension does not match state variables");
    }
    const int N = static_cast<int>(points.cols());
    const int M_z = static_cast<int>(structure.state_exps.rows());
    const int M_k = static_cast<int>(structure.param_exps.rows());

    // Phi(n, i) = z_n ^ state_exps.row(i)，每个状态指数模式只算一次
    Eigen::MatrixXd Phi(N, M_z);
    for (int n = 0; n < N; ++n) {
        for (int i = 0; i < M_z; ++i) {
            double v = 1.0;
            for (int j = 0; j < n_z; ++j) v *= integerPower(points(j, n), structure.state_exps(i, j));
            Phi(n, i) = v;
        }
    }
    // 每行是一个点上 k 单项式的系数
    const Eigen::MatrixXd K = Phi * structure.coeffs;

    std::vector<Polynomial> out;
    out.reserve(N);
    std::vector<int> exps(structure.param_vars.size());
    for (int n = 0; n < N; ++n) {
        Polynomial p(structure.param_vars);
        for (int j = 0; j < M_k; ++j) {
            for (size_t d = 0; d < exps.size(); ++d) exps[d] = structure.param_exps(j, d);
            p.addTerm(K(n, j), exps);
        }
        out.push_back(std::move(p));
    }
    return out;
}

Polynomial frsConstraintPolynomial(const FrsModel& frs) {
    // FRS = {I >= 1}，取 1 - I 使 FRS 外部为正
    return 1.0 - frs.frs_polynomial;
}

void ConstraintSet::evaluate(const Eigen::VectorXd& k, Eigen::VectorXd& values,
                             Eigen::MatrixXd& jacobian) const {
    const int m = static_cast<int>(polynomials.size());
    values.resize(m);
    jacobian.resize(m, k.size());
    for (int j = 0; j < m; ++j) {
        values(j) = polynomials[j].evaluate(k);
        for (int i = 0; i < k.size(); ++i) {
            jacobian(j, i) = gradients[j][i].evaluate(k);
        }
    }
}

ConstraintSet buildConstraintSet(const FrsModel& frs, const Eigen::Matrix2Xd& points_frs) {
    const FrsPolynomialStructure structure =
        decompose(frsConstraintPolynomial(frs), frs.z_vars, frs.k_vars);

    ConstraintSet cons;
    cons.polynomials = evaluateOnPoints(structure, points_frs);
    cons.gradients.reserve(cons.polynomials.size());
    for (const auto& p : cons.polynomials) {
        cons.gradients.push_back(gradient(p));
    }
    return cons;
}
