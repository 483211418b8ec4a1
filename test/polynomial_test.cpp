#include <cassert>
#include <cmath>
#include <cstdio>
#include <random>
#include <stdexcept>
#include "polynomial.hpp"

static inline bool near(double a, double b, double tol=1e-9) {
    return std::abs(a-b) <= tol;
}

int main() {
    const std::vector<std::string> xy = {"x", "y"};
    Polynomial x = Polynomial::variable(xy, "x");
    Polynomial y = Polynomial::variable(xy, "y");

    // evaluate: p = 3 x^2 y - 2 y + 1
    {
        Polynomial p = 3.0 * x.pow(2) * y - 2.0 * y + 1.0;
        assert(p.terms().size() == 3u);
        assert(p.degree() == 3);
        Eigen::VectorXd v(2); v << 2.0, 3.0;
        assert(near(p.evaluate(v), 31.0));
    }

    // 同类项合并与零多项式
    {
        Polynomial p = x * y + 2.0 * x;
        Polynomial q = p - p;
        assert(q.isZero());
        Polynomial r = x * y + x * y;
        assert(r.terms().size() == 1u);
        assert(near(r.terms()[0].coeff, 2.0));
    }

    // 单项式按指数字典序排列
    {
        Polynomial p = y.pow(2) + x + 1.0 + x * y;
        for (size_t i = 1; i < p.terms().size(); ++i) {
            assert(p.terms()[i - 1].exps < p.terms()[i].exps);
        }
    }

    // partial
    {
        Polynomial p = 3.0 * x.pow(2) * y - 2.0 * y + 1.0;
        Eigen::VectorXd v(2); v << 2.0, 3.0;
        assert(near(p.partial("x").evaluate(v), 36.0));
        assert(near(p.partial("y").evaluate(v), 10.0));
        assert(p.partial(0).variables() == xy);
        assert(Polynomial::constant(xy, 4.0).partial("x").isZero());
    }

    // substitute
    {
        Polynomial p = 3.0 * x.pow(2) * y - 2.0 * y + 1.0;
        Eigen::VectorXd yv(1); yv << 3.0;
        Polynomial px = p.substitute({"y"}, yv);
        assert(px.variables().size() == 1u && px.variables()[0] == "x");
        Eigen::VectorXd xv(1); xv << 2.0;
        assert(near(px.evaluate(xv), 31.0));
        // 代入全部变量得到常数
        Eigen::VectorXd both(2); both << 3.0, 2.0;
        Polynomial c = p.substitute({"y", "x"}, both);
        assert(c.numVariables() == 0);
        assert(near(c.evaluate(Eigen::VectorXd(0)), 31.0));
    }

    // pow
    {
        Polynomial p = (x + 1.0).pow(3);
        assert(p.terms().size() == 4u);
        Eigen::VectorXd v(2); v << 2.0, 0.0;
        assert(near(p.evaluate(v), 27.0));
        assert(near((x + 1.0).pow(0).evaluate(v), 1.0));
    }

    // 变量不一致时报错
    {
        Polynomial z = Polynomial::variable({"z"}, "z");
        bool thrown = false;
        try { (void)(x + z); } catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);
        thrown = false;
        try { (void)Polynomial::variable(xy, "w"); } catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);
        thrown = false;
        try { Polynomial q(xy); q.addTerm(1.0, {1}); } catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);
    }

    // 梯度与有限差分
    {
        Polynomial p = 0.5 * x.pow(4) - 1.5 * x.pow(2) * y.pow(3) + 2.0 * x * y - y + 0.25;
        std::vector<Polynomial> g = gradient(p);
        assert(g.size() == 2u);
        std::mt19937 rng(3);
        std::uniform_real_distribution<double> u(-1.0, 1.0);
        const double h = 1e-6;
        for (int trial = 0; trial < 20; ++trial) {
            Eigen::VectorXd v(2); v << u(rng), u(rng);
            for (int i = 0; i < 2; ++i) {
                Eigen::VectorXd vp = v, vm = v;
                vp(i) += h; vm(i) -= h;
                double fd = (p.evaluate(vp) - p.evaluate(vm)) / (2.0 * h);
                assert(near(g[i].evaluate(v), fd, 1e-6));
            }
        }
    }

    std::printf("PASS: polynomial basic checks\n");
    return 0;
}
