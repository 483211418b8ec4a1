#include "polynomial.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

double integerPower(double x, int n) {
    double r = 1.0;
    for (int i = 0; i < n; ++i) r *= x;
    return r;
}

Polynomial::Polynomial(std::vector<std::string> variables)
    : variables_(std::move(variables)) {}

Polynomial Polynomial::constant(const std::vector<std::string>& variables, double c) {
    Polynomial p(variables);
    p.addTerm(c, std::vector<int>(variables.size(), 0));
    return p;
}

Polynomial Polynomial::variable(const std::vector<std::string>& variables, const std::string& name) {
    Polynomial p(variables);
    int idx = p.indexOf(name);
    if (idx < 0) {
        throw std::invalid_argument("Polynomial: unknown variable " + name);
    }
    std::vector<int> exps(variables.size(), 0);
    exps[idx] = 1;
    p.addTerm(1.0, exps);
    return p;
}

int Polynomial::indexOf(const std::string& name) const {
    for (size_t i = 0; i < variables_.size(); ++i) {
        if (variables_[i] == name) return static_cast<int>(i);
    }
    return -1;
}

int Polynomial::degree() const {
    int d = 0;
    for (const auto& t : terms_) {
        int s = 0;
        for (int e : t.exps) s += e;
        d = std::max(d, s);
    }
    return d;
}

void Polynomial::addTerm(double coeff, const std::vector<int>& exps) {
    if (exps.size() != variables_.size()) {
        throw std::invalid_argument("Polynomial: exponent vector length mismatch");
    }
    for (int e : exps) {
        if (e < 0) throw std::invalid_argument("Polynomial: negative exponent");
    }
    if (coeff == 0.0) return;

    // 保持有序：二分查找插入位置，同类项直接合并
    auto it = std::lower_bound(terms_.begin(), terms_.end(), exps,
        [](const Monomial& m, const std::vector<int>& e) { return m.exps < e; });
    if (it != terms_.end() && it->exps == exps) {
        it->coeff += coeff;
        if (it->coeff == 0.0) terms_.erase(it);
    } else {
        terms_.insert(it, Monomial{coeff, exps});
    }
}

double Polynomial::evaluate(const Eigen::VectorXd& x) const {
    if (x.size() != numVariables()) {
        throw std::invalid_argument("Polynomial::evaluate: wrong number of values");
    }
    double sum = 0.0;
    for (const auto& t : terms_) {
        double v = t.coeff;
        for (size_t i = 0; i < t.exps.size(); ++i) {
            if (t.exps[i] != 0) v *= integerPower(x(i), t.exps[i]);
        }
        sum += v;
    }
    return sum;
}

Polynomial Polynomial::partial(int var) const {
    if (var < 0 || var >= numVariables()) {
        throw std::out_of_range("Polynomial::partial: variable index out of range");
    }
    Polynomial d(variables_);
    for (const auto& t : terms_) {
        int e = t.exps[var];
        if (e == 0) continue;
        std::vector<int> exps = t.exps;
        exps[var] = e - 1;
        d.addTerm(t.coeff * e, exps);
    }
    return d;
}

Polynomial Polynomial::partial(const std::string& name) const {
    int idx = indexOf(name);
    if (idx < 0) {
        throw std::invalid_argument("Polynomial::partial: unknown variable " + name);
    }
    return partial(idx);
}

Polynomial Polynomial::substitute(const std::vector<std::string>& names,
                                  const Eigen::VectorXd& values) const {
    if (static_cast<int>(names.size()) != values.size()) {
        throw std::invalid_argument("Polynomial::substitute: names/values size mismatch");
    }
    // 被代入变量 -> 数值下标
    std::vector<int> sub_idx(variables_.size(), -1);
    for (size_t j = 0; j < names.size(); ++j) {
        int idx = indexOf(names[j]);
        if (idx < 0) {
            throw std::invalid_argument("Polynomial::substitute: unknown variable " + names[j]);
        }
        sub_idx[idx] = static_cast<int>(j);
    }

    std::vector<std::string> remaining;
    for (size_t i = 0; i < variables_.size(); ++i) {
        if (sub_idx[i] < 0) remaining.push_back(variables_[i]);
    }

    Polynomial out(remaining);
    std::vector<int> exps(remaining.size(), 0);
    for (const auto& t : terms_) {
        double c = t.coeff;
        int r = 0;
        for (size_t i = 0; i < variables_.size(); ++i) {
            if (sub_idx[i] >= 0) {
                c *= integerPower(values(sub_idx[i]), t.exps[i]);
            } else {
                exps[r++] = t.exps[i];
            }
        }
        out.addTerm(c, exps);
    }
    return out;
}

void Polynomial::requireSameVariables(const Polynomial& other) const {
    if (variables_ != other.variables_) {
        throw std::invalid_argument("Polynomial: operands use different variables");
    }
}

void Polynomial::canonicalize() {
    std::sort(terms_.begin(), terms_.end(),
              [](const Monomial& a, const Monomial& b) { return a.exps < b.exps; });
    std::vector<Monomial> merged;
    merged.reserve(terms_.size());
    for (auto& t : terms_) {
        if (!merged.empty() && merged.back().exps == t.exps) {
            merged.back().coeff += t.coeff;
        } else {
            merged.push_back(std::move(t));
        }
    }
    merged.erase(std::remove_if(merged.begin(), merged.end(),
                                [](const Monomial& m) { return m.coeff == 0.0; }),
                 merged.end());
    terms_ = std::move(merged);
}

Polynomial Polynomial::operator+(const Polynomial& other) const {
    requireSameVariables(other);
    Polynomial out(*this);
    out.terms_.insert(out.terms_.end(), other.terms_.begin(), other.terms_.end());
    out.canonicalize();
    return out;
}

Polynomial Polynomial::operator-(const Polynomial& other) const {
    return *this + (-other);
}

Polynomial Polynomial::operator*(const Polynomial& other) const {
    requireSameVariables(other);
    Polynomial out(variables_);
    out.terms_.reserve(terms_.size() * other.terms_.size());
    for (const auto& a : terms_) {
        for (const auto& b : other.terms_) {
            Monomial m{a.coeff * b.coeff, a.exps};
            for (size_t i = 0; i < m.exps.size(); ++i) m.exps[i] += b.exps[i];
            out.terms_.push_back(std::move(m));
        }
    }
    out.canonicalize();
    return out;
}

Polynomial Polynomial::operator*(double s) const {
    Polynomial out(*this);
    for (auto& t : out.terms_) t.coeff *= s;
    out.canonicalize();
    return out;
}

Polynomial Polynomial::operator+(double c) const {
    Polynomial out(*this);
    out.addTerm(c, std::vector<int>(variables_.size(), 0));
    return out;
}

Polynomial Polynomial::operator-(double c) const {
    return *this + (-c);
}

Polynomial Polynomial::operator-() const {
    return *this * -1.0;
}

Polynomial Polynomial::pow(int n) const {
    if (n < 0) throw std::invalid_argument("Polynomial::pow: negative power");
    Polynomial out = constant(variables_, 1.0);
    for (int i = 0; i < n; ++i) out = out * (*this);
    return out;
}

std::vector<Polynomial> gradient(const Polynomial& p) {
    std::vector<Polynomial> g;
    g.reserve(p.numVariables());
    for (int i = 0; i < p.numVariables(); ++i) g.push_back(p.partial(i));
    return g;
}
