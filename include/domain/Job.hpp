#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace economy::domain {

/**
 * @brief Работа из каталога
 */
struct Job {
    std::string name;          ///< Имя, которым работу вызывают из чата
    std::string description;
    int64_t baseSalary = 0;    ///< Основа для бонуса за уровень
    int64_t salaryMin = 0;
    int64_t salaryMax = 0;
    int levelRequired = 1;
    double cooldownHours = 1.0;
    int64_t expReward = 0;
};

/**
 * @brief Статический каталог работ
 *
 * Порядок важен только для отображения: от простых к высокооплачиваемым.
 */
class JobCatalog {
public:
    JobCatalog() : jobs_(defaultJobs()) {}

    explicit JobCatalog(std::vector<Job> jobs) : jobs_(std::move(jobs)) {}

    std::optional<Job> find(const std::string& name) const {
        for (const auto& job : jobs_) {
            if (job.name == name) {
                return job;
            }
        }
        return std::nullopt;
    }

    const std::vector<Job>& all() const {
        return jobs_;
    }

    static std::vector<Job> defaultJobs() {
        return {
            {"搬砖",       "基础体力劳动，收入稳定", 80,   60,  120,  1,  1.0, 5},
            {"送外卖",     "跑腿送餐，按单计费",     120,  80,  180,  1,  1.0, 8},
            {"便利店员",   "店内服务，轻松稳定",     150,  100, 200,  2,  2.0, 10},
            {"快递员",     "配送包裹，按件提成",     200,  150, 280,  3,  2.0, 15},
            {"客服代表",   "电话客服，沟通为主",     250,  180, 350,  5,  3.0, 20},
            {"设计师",     "创意设计，需要灵感",     450,  280, 700,  8,  4.0, 40},
            {"程序员",     "代码开发，技术要求高",   500,  300, 800,  10, 4.0, 50},
            {"金融分析师", "市场分析，高薪工作",     800,  500, 1200, 15, 6.0, 80},
            {"企业顾问",   "战略咨询，顶级收入",     1000, 600, 1500, 20, 8.0, 100},
        };
    }

private:
    std::vector<Job> jobs_;
};

} // namespace economy::domain
