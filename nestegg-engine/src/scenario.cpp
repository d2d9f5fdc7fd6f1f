#include "scenario.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <set>

namespace nestegg {

namespace {

std::string lowercase(const std::string& value) {
    std::string out = value;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string indexed_field(const char* collection, size_t index, const char* field) {
    return std::string(collection) + "[" + std::to_string(index) + "]." + field;
}

void require_finite(double value, const std::string& field) {
    if (!std::isfinite(value)) {
        throw ConfigurationError(field, "must be finite");
    }
}

void require_non_negative(double value, const std::string& field) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ConfigurationError(field, "must be a finite non-negative number");
    }
}

void require_window(const std::optional<int>& start, const std::optional<int>& end,
                    const std::string& field) {
    if (start && end && *end < *start) {
        throw ConfigurationError(field, "end_year precedes start_year");
    }
}

} // anonymous namespace

std::string to_string(IncomeKind kind) {
    switch (kind) {
        case IncomeKind::Salary: return "salary";
        case IncomeKind::Rental: return "rental";
        case IncomeKind::Gift: return "gift";
    }
    return "unknown";
}

std::string to_string(AssetType type) {
    switch (type) {
        case AssetType::Cash: return "CASH";
        case AssetType::Isa: return "ISA";
        case AssetType::Gia: return "GIA";
        case AssetType::Pension: return "PENSION";
    }
    return "UNKNOWN";
}

IncomeKind income_kind_from_string(const std::string& name, const std::string& field) {
    std::string key = lowercase(name);
    if (key == "salary") return IncomeKind::Salary;
    if (key == "rental") return IncomeKind::Rental;
    if (key == "gift") return IncomeKind::Gift;
    throw ConfigurationError(field, "unknown income kind '" + name + "'");
}

AssetType asset_type_from_string(const std::string& name, const std::string& field) {
    std::string key = lowercase(name);
    if (key == "cash") return AssetType::Cash;
    if (key == "isa") return AssetType::Isa;
    if (key == "gia") return AssetType::Gia;
    if (key == "pension") return AssetType::Pension;
    throw ConfigurationError(field, "unknown asset type '" + name + "'");
}

// ============================================================================
// Person
// ============================================================================

Person::Person()
    : birth_year(1970)
    , birth_month(1)
    , birth_day(1)
    , planned_retirement_age(65)
    , state_pension_age(67)
    , is_child(false)
    , annual_cost(0.0)
    , leaves_household_age(18)
{}

int Person::retirement_age(int offset) const {
    long long age = static_cast<long long>(planned_retirement_age) + offset;
    return static_cast<int>(std::clamp<long long>(age, 0, std::numeric_limits<int>::max()));
}

int Person::retirement_year(int offset) const {
    long long year = static_cast<long long>(birth_year) + retirement_age(offset);
    return static_cast<int>(std::clamp<long long>(year, std::numeric_limits<int>::min(),
                                                  std::numeric_limits<int>::max()));
}

bool Person::is_retired_in_year(int year, int offset) const {
    return age_in_year(year) >= retirement_age(offset);
}

bool Person::is_state_pension_eligible_in_year(int year) const {
    return age_in_year(year) >= state_pension_age;
}

bool Person::can_access_pension_in_year(int year, int access_age) const {
    return age_in_year(year) >= access_age;
}

bool Person::is_dependent_in_year(int year) const {
    int age = age_in_year(year);
    return is_child && age >= 0 && age < leaves_household_age;
}

// ============================================================================
// IncomeSource / Asset / Mortgage / Expense
// ============================================================================

IncomeSource::IncomeSource()
    : kind(IncomeKind::Salary)
    , gross_annual(0.0)
    , growth_rate(0.0)
    , employee_pension_pct(0.0)
    , employer_pension_pct(0.0)
{}

bool IncomeSource::active_in_year(int year) const {
    if (start_year && year < *start_year) return false;
    if (end_year && year > *end_year) return false;
    return true;
}

double IncomeSource::amount_in_year(int year, int projection_start_year) const {
    int elapsed = std::max(0, year - projection_start_year);
    return gross_annual * std::pow(1.0 + growth_rate, elapsed);
}

Asset::Asset()
    : type(AssetType::Cash)
    , balance(0.0)
    , annual_contribution_cap(0.0)
    , withdrawal_priority(0)
    , contributions_stop_at_retirement(false)
{}

Mortgage::Mortgage()
    : balance(0.0)
    , annual_interest_rate(0.0)
    , monthly_payment(0.0)
{}

Expense::Expense()
    : monthly_amount(0.0)
    , inflation_linked(true)
{}

bool Expense::active_in_year(int year) const {
    if (start_year && year < *start_year) return false;
    if (end_year && year > *end_year) return false;
    return true;
}

Assumptions::Assumptions()
    : inflation_rate(0.02)
    , equity_return_mean(0.05)
    , equity_return_std(0.10)
    , isa_annual_limit(20000.0)
    , state_pension_annual(11500.0)
    , pension_access_age(55)
    , start_year(2025)
    , end_year(2085)
    , annual_spend_target(0.0)
    , emergency_fund_months(6.0)
    , tax_band_indexation(0.0)
{}

// ============================================================================
// Scenario
// ============================================================================

Scenario::Scenario()
    : tax_bands(TaxBands::uk_2024())
{}

size_t Scenario::num_years() const {
    if (assumptions.end_year < assumptions.start_year) {
        return 0;
    }
    return static_cast<size_t>(assumptions.end_year - assumptions.start_year) + 1;
}

size_t Scenario::person_index(const std::string& id) const {
    for (size_t i = 0; i < people.size(); ++i) {
        if (people[i].id == id) {
            return i;
        }
    }
    throw ConfigurationError("person_id", "unknown person '" + id + "'");
}

size_t Scenario::owner_index(const std::optional<std::string>& person_id) const {
    if (person_id) {
        return person_index(*person_id);
    }
    for (size_t i = 0; i < people.size(); ++i) {
        if (!people[i].is_child) {
            return i;
        }
    }
    return 0;
}

double Scenario::asset_growth_mean(size_t asset_index) const {
    const Asset& asset = assets.at(asset_index);
    if (asset.growth_mean) {
        return *asset.growth_mean;
    }
    return asset.type == AssetType::Cash ? 0.0 : assumptions.equity_return_mean;
}

double Scenario::asset_growth_std(size_t asset_index) const {
    const Asset& asset = assets.at(asset_index);
    if (asset.growth_std) {
        return *asset.growth_std;
    }
    return asset.type == AssetType::Cash ? 0.0 : assumptions.equity_return_std;
}

void Scenario::validate() const {
    const Assumptions& a = assumptions;
    if (a.end_year <= a.start_year) {
        throw ConfigurationError("assumptions.end_year", "must be after start_year");
    }
    if (!std::isfinite(a.inflation_rate) || a.inflation_rate <= -1.0) {
        throw ConfigurationError("assumptions.inflation_rate", "must be finite and greater than -1");
    }
    require_finite(a.equity_return_mean, "assumptions.equity_return_mean");
    require_non_negative(a.equity_return_std, "assumptions.equity_return_std");
    require_non_negative(a.isa_annual_limit, "assumptions.isa_annual_limit");
    require_non_negative(a.state_pension_annual, "assumptions.state_pension_annual");
    require_non_negative(a.annual_spend_target, "assumptions.annual_spend_target");
    require_non_negative(a.emergency_fund_months, "assumptions.emergency_fund_months");
    if (a.pension_access_age < 0) {
        throw ConfigurationError("assumptions.pension_access_age", "must be non-negative");
    }
    if (!std::isfinite(a.tax_band_indexation) || a.tax_band_indexation <= -1.0) {
        throw ConfigurationError("assumptions.tax_band_indexation", "must be finite and greater than -1");
    }

    TaxCalculator::validate_bands(tax_bands, "tax");

    if (people.empty()) {
        throw ConfigurationError("people", "at least one person is required");
    }
    std::set<std::string> person_ids;
    for (size_t i = 0; i < people.size(); ++i) {
        const Person& p = people[i];
        if (p.id.empty()) {
            throw ConfigurationError(indexed_field("people", i, "id"), "must not be empty");
        }
        if (!person_ids.insert(p.id).second) {
            throw ConfigurationError(indexed_field("people", i, "id"), "duplicate person id '" + p.id + "'");
        }
        if (p.birth_month < 1 || p.birth_month > 12 || p.birth_day < 1 || p.birth_day > 31) {
            throw ConfigurationError(indexed_field("people", i, "birth_date"), "invalid calendar date");
        }
        if (p.planned_retirement_age < 0) {
            throw ConfigurationError(indexed_field("people", i, "planned_retirement_age"), "must be non-negative");
        }
        if (p.state_pension_age < 0) {
            throw ConfigurationError(indexed_field("people", i, "state_pension_age"), "must be non-negative");
        }
        require_non_negative(p.annual_cost, indexed_field("people", i, "annual_cost"));
        if (p.leaves_household_age < 0) {
            throw ConfigurationError(indexed_field("people", i, "leaves_household_age"), "must be non-negative");
        }
    }

    auto check_owner = [&](const std::optional<std::string>& owner, const std::string& field) {
        if (owner && person_ids.count(*owner) == 0) {
            throw ConfigurationError(field, "unknown person '" + *owner + "'");
        }
    };

    for (size_t i = 0; i < incomes.size(); ++i) {
        const IncomeSource& inc = incomes[i];
        require_non_negative(inc.gross_annual, indexed_field("incomes", i, "gross_annual"));
        if (!std::isfinite(inc.growth_rate) || inc.growth_rate <= -1.0) {
            throw ConfigurationError(indexed_field("incomes", i, "annual_growth_rate"),
                                     "must be finite and greater than -1");
        }
        if (!std::isfinite(inc.employee_pension_pct) || inc.employee_pension_pct < 0.0 ||
            inc.employee_pension_pct > 1.0) {
            throw ConfigurationError(indexed_field("incomes", i, "employee_pension_pct"), "must be in [0, 1]");
        }
        if (!std::isfinite(inc.employer_pension_pct) || inc.employer_pension_pct < 0.0 ||
            inc.employer_pension_pct > 1.0) {
            throw ConfigurationError(indexed_field("incomes", i, "employer_pension_pct"), "must be in [0, 1]");
        }
        check_owner(inc.person_id, indexed_field("incomes", i, "person_id"));
        if (inc.kind == IncomeKind::Salary && inc.person_id && people[person_index(*inc.person_id)].is_child) {
            throw ConfigurationError(indexed_field("incomes", i, "person_id"),
                                     "salary cannot belong to a child '" + *inc.person_id + "'");
        }
        require_window(inc.start_year, inc.end_year, indexed_field("incomes", i, "end_year"));
    }

    std::set<std::string> asset_ids;
    for (size_t i = 0; i < assets.size(); ++i) {
        const Asset& asset = assets[i];
        if (asset.id.empty()) {
            throw ConfigurationError(indexed_field("assets", i, "id"), "must not be empty");
        }
        if (!asset_ids.insert(asset.id).second) {
            throw ConfigurationError(indexed_field("assets", i, "id"), "duplicate asset id '" + asset.id + "'");
        }
        require_non_negative(asset.balance, indexed_field("assets", i, "balance"));
        require_non_negative(asset.annual_contribution_cap, indexed_field("assets", i, "annual_contribution"));
        if (asset.growth_mean) {
            require_finite(*asset.growth_mean, indexed_field("assets", i, "growth_rate_mean"));
        }
        if (asset.growth_std) {
            require_non_negative(*asset.growth_std, indexed_field("assets", i, "growth_rate_std"));
        }
        if (asset.cost_basis) {
            require_non_negative(*asset.cost_basis, indexed_field("assets", i, "cost_basis"));
        }
        check_owner(asset.person_id, indexed_field("assets", i, "person_id"));
    }

    if (mortgage) {
        require_non_negative(mortgage->balance, "mortgage.balance");
        require_non_negative(mortgage->annual_interest_rate, "mortgage.annual_interest_rate");
        require_non_negative(mortgage->monthly_payment, "mortgage.monthly_payment");
    }

    for (size_t i = 0; i < expenses.size(); ++i) {
        require_non_negative(expenses[i].monthly_amount, indexed_field("expenses", i, "monthly_amount"));
        require_window(expenses[i].start_year, expenses[i].end_year, indexed_field("expenses", i, "end_year"));
    }
}

} // namespace nestegg
