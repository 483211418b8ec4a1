#pragma once
#include <string>
#include <vector>
#include <Eigen/Dense>

// 单项式：coeff * x_0^exps[0] * x_1^exps[1] * ...
struct Monomial {
    double coeff = 0.0;
    std::vector<int> exps;
};

// 稀疏多元多项式
// 按指数向量字典序保存 (系数, 指数) 列表，同类项合并，零系数项删除
class Polynomial {
public:
    Polynomial() = default;
    explicit Polynomial(std::vector<std::string> variables);

    static Polynomial constant(const std::vector<std::string>& variables, double c);
    static Polynomial variable(const std::vector<std::string>& variables, const std::string& name);

    const std::vector<std::string>& variables() const { return variables_; }
    const std::vector<Monomial>& terms() const { return terms_; }
    int numVariables() const { return static_cast<int>(variables_.size()); }

    // 变量下标，不存在返回 -1
    int indexOf(const std::string& name) const;
    bool isZero() const { return terms_.empty(); }
    int degree() const;

    void addTerm(double coeff, const std::vector<int>& exps);

    // x 按 variables() 的顺序给出
    double evaluate(const Eigen::VectorXd& x) const;

    // 对单个变量的解析偏导（指数和变量列表不变）
    Polynomial partial(int var) const;
    Polynomial partial(const std::string& name) const;

    // 把 names 中的变量代入数值，返回剩余变量上的多项式
    Polynomial substitute(const std::vector<std::string>& names,
                          const Eigen::VectorXd& values) const;

    Polynomial operator+(const Polynomial& other) const;
    Polynomial operator-(const Polynomial& other) const;
    Polynomial operator*(const Polynomial& other) const;
    Polynomial operator*(double s) const;
    Polynomial operator+(double c) const;
    Polynomial operator-(double c) const;
    Polynomial operator-() const;
    Polynomial pow(int n) const;

private:
    void requireSameVariables(const Polynomial& other) const;
    void canonicalize();

    std::vector<std::string> variables_;
    std::vector<Monomial> terms_;
};

inline Polynomial operator*(double s, const Polynomial& p) { return p * s; }
inline Polynomial operator+(double c, const Polynomial& p) { return p + c; }
inline Polynomial operator-(double c, const Polynomial& p) { return -p + c; }

// 整数次幂，0^0 = 1
double integerPower(double x, int n);

// 对每个变量求偏导，返回与 p.variables() 同序的梯度
std::vector<Polynomial> gradient(const Polynomial& p);
