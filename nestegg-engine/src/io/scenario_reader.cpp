#include "scenario_reader.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace nestegg {
namespace io {

namespace {

std::string join(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

std::string element(const std::string& path, size_t index) {
    return path + "[" + std::to_string(index) + "]";
}

template <typename T>
std::optional<T> read_optional(const json& obj, const char* key, const std::string& path) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return std::nullopt;
    }
    try {
        return it->get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(join(path, key), e.what());
    }
}

template <typename T>
T read_field(const json& obj, const char* key, const T& fallback, const std::string& path) {
    std::optional<T> value = read_optional<T>(obj, key, path);
    return value ? *value : fallback;
}

template <typename T>
T read_required(const json& obj, const char* key, const std::string& path) {
    std::optional<T> value = read_optional<T>(obj, key, path);
    if (!value) {
        throw ConfigurationError(join(path, key), "is required");
    }
    return *value;
}

const json* read_array(const json& obj, const char* key, const std::string& path) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return nullptr;
    }
    if (!it->is_array()) {
        throw ConfigurationError(join(path, key), "must be an array");
    }
    return &*it;
}

void require_object(const json& value, const std::string& path) {
    if (!value.is_object()) {
        throw ConfigurationError(path, "must be an object");
    }
}

void parse_birth_date(const std::string& text, Person& person, const std::string& field) {
    std::istringstream iss(text);
    int year = 0, month = 0, day = 0;
    char sep1 = 0, sep2 = 0;
    if (!(iss >> year >> sep1 >> month >> sep2 >> day) || sep1 != '-' || sep2 != '-') {
        throw ConfigurationError(field, "expected YYYY-MM-DD, got '" + text + "'");
    }
    person.birth_year = year;
    person.birth_month = month;
    person.birth_day = day;
}

Person parse_person(const json& j, const std::string& path) {
    require_object(j, path);
    Person person;
    person.id = read_required<std::string>(j, "id", path);
    person.label = read_field<std::string>(j, "label", person.id, path);
    if (auto date = read_optional<std::string>(j, "birth_date", path)) {
        parse_birth_date(*date, person, join(path, "birth_date"));
    } else {
        person.birth_year = read_required<int>(j, "birth_year", path);
    }
    person.planned_retirement_age = read_field<int>(j, "planned_retirement_age",
                                                    person.planned_retirement_age, path);
    person.state_pension_age = read_field<int>(j, "state_pension_age", person.state_pension_age, path);
    person.is_child = read_field<bool>(j, "is_child", person.is_child, path);
    person.annual_cost = read_field<double>(j, "annual_cost", person.annual_cost, path);
    person.leaves_household_age = read_field<int>(j, "leaves_household_age",
                                                  person.leaves_household_age, path);
    return person;
}

IncomeSource parse_income(const json& j, const std::string& path) {
    require_object(j, path);
    IncomeSource income;
    income.id = read_field<std::string>(j, "id", path, path);
    income.kind = income_kind_from_string(read_required<std::string>(j, "kind", path), join(path, "kind"));
    income.person_id = read_optional<std::string>(j, "person_id", path);
    income.gross_annual = read_field<double>(j, "gross_annual", 0.0, path);
    income.growth_rate = read_field<double>(j, "annual_growth_rate", 0.0, path);
    income.employee_pension_pct = read_field<double>(j, "employee_pension_pct", 0.0, path);
    income.employer_pension_pct = read_field<double>(j, "employer_pension_pct", 0.0, path);
    income.start_year = read_optional<int>(j, "start_year", path);
    income.end_year = read_optional<int>(j, "end_year", path);
    return income;
}

Asset parse_asset(const json& j, const std::string& path) {
    require_object(j, path);
    Asset asset;
    asset.id = read_required<std::string>(j, "id", path);
    asset.name = read_field<std::string>(j, "name", asset.id, path);
    asset.type = asset_type_from_string(read_required<std::string>(j, "type", path), join(path, "type"));
    asset.balance = read_field<double>(j, "balance", 0.0, path);
    asset.annual_contribution_cap = read_field<double>(j, "annual_contribution", 0.0, path);
    asset.growth_mean = read_optional<double>(j, "growth_rate_mean", path);
    asset.growth_std = read_optional<double>(j, "growth_rate_std", path);
    asset.withdrawal_priority = read_field<int>(j, "withdrawal_priority", 0, path);
    asset.contributions_stop_at_retirement =
        read_field<bool>(j, "contributions_end_at_retirement", false, path);
    asset.person_id = read_optional<std::string>(j, "person_id", path);
    asset.cost_basis = read_optional<double>(j, "cost_basis", path);
    return asset;
}

Expense parse_expense(const json& j, const std::string& path) {
    require_object(j, path);
    Expense expense;
    expense.name = read_field<std::string>(j, "name", path, path);
    expense.monthly_amount = read_field<double>(j, "monthly_amount", 0.0, path);
    expense.inflation_linked = read_field<bool>(j, "inflation_linked", true, path);
    expense.start_year = read_optional<int>(j, "start_year", path);
    expense.end_year = read_optional<int>(j, "end_year", path);
    return expense;
}

Assumptions parse_assumptions(const json& j, const std::string& path) {
    require_object(j, path);
    Assumptions a;
    a.inflation_rate = read_field<double>(j, "inflation_rate", a.inflation_rate, path);
    a.equity_return_mean = read_field<double>(j, "equity_return_mean", a.equity_return_mean, path);
    a.equity_return_std = read_field<double>(j, "equity_return_std", a.equity_return_std, path);
    a.isa_annual_limit = read_field<double>(j, "isa_annual_limit", a.isa_annual_limit, path);
    a.state_pension_annual = read_field<double>(j, "state_pension_annual", a.state_pension_annual, path);
    a.pension_access_age = read_field<int>(j, "pension_access_age", a.pension_access_age, path);
    a.start_year = read_field<int>(j, "start_year", a.start_year, path);
    a.end_year = read_field<int>(j, "end_year", a.end_year, path);
    a.annual_spend_target = read_field<double>(j, "annual_spend_target", a.annual_spend_target, path);
    a.emergency_fund_months = read_field<double>(j, "emergency_fund_months", a.emergency_fund_months, path);
    a.tax_band_indexation = read_field<double>(j, "tax_band_indexation", a.tax_band_indexation, path);
    return a;
}

std::vector<TaxBand> parse_bands(const json& j, const char* key, const std::vector<TaxBand>& fallback,
                                 const std::string& path) {
    const json* bands = read_array(j, key, path);
    if (!bands) {
        return fallback;
    }
    std::vector<TaxBand> out;
    for (size_t i = 0; i < bands->size(); ++i) {
        std::string band_path = element(join(path, key), i);
        const json& band = (*bands)[i];
        require_object(band, band_path);
        out.push_back(TaxBand{read_required<double>(band, "threshold", band_path),
                              read_required<double>(band, "rate", band_path)});
    }
    return out;
}

TaxBands parse_tax(const json& j, const std::string& path) {
    require_object(j, path);
    TaxBands bands = TaxBands::uk_2024();
    bands.income_tax = parse_bands(j, "income_tax", bands.income_tax, path);
    bands.national_insurance = parse_bands(j, "national_insurance", bands.national_insurance, path);
    bands.cgt_annual_allowance = read_field<double>(j, "cgt_annual_allowance", bands.cgt_annual_allowance, path);
    bands.cgt_rate = read_field<double>(j, "cgt_rate", bands.cgt_rate, path);
    bands.pension_tax_free_fraction =
        read_field<double>(j, "pension_tax_free_fraction", bands.pension_tax_free_fraction, path);
    return bands;
}

Scenario parse_scenario(const json& j) {
    require_object(j, "scenario");
    Scenario scenario;
    scenario.scenario_id = read_field<std::string>(j, "scenario_id", "default", "");

    const json* people = read_array(j, "people", "");
    if (!people || people->empty()) {
        throw ConfigurationError("people", "at least one person is required");
    }
    for (size_t i = 0; i < people->size(); ++i) {
        scenario.people.push_back(parse_person((*people)[i], element("people", i)));
    }

    if (const json* incomes = read_array(j, "incomes", "")) {
        for (size_t i = 0; i < incomes->size(); ++i) {
            scenario.incomes.push_back(parse_income((*incomes)[i], element("incomes", i)));
        }
    }
    if (const json* assets = read_array(j, "assets", "")) {
        for (size_t i = 0; i < assets->size(); ++i) {
            scenario.assets.push_back(parse_asset((*assets)[i], element("assets", i)));
        }
    }
    if (const json* expenses = read_array(j, "expenses", "")) {
        for (size_t i = 0; i < expenses->size(); ++i) {
            scenario.expenses.push_back(parse_expense((*expenses)[i], element("expenses", i)));
        }
    }

    auto mortgage = j.find("mortgage");
    if (mortgage != j.end() && !mortgage->is_null()) {
        require_object(*mortgage, "mortgage");
        Mortgage m;
        m.balance = read_field<double>(*mortgage, "balance", 0.0, "mortgage");
        m.annual_interest_rate = read_field<double>(*mortgage, "annual_interest_rate", 0.0, "mortgage");
        m.monthly_payment = read_field<double>(*mortgage, "monthly_payment", 0.0, "mortgage");
        scenario.mortgage = m;
    }

    auto assumptions = j.find("assumptions");
    if (assumptions != j.end() && !assumptions->is_null()) {
        scenario.assumptions = parse_assumptions(*assumptions, "assumptions");
    }

    auto tax = j.find("tax");
    if (tax != j.end() && !tax->is_null()) {
        scenario.tax_bands = parse_tax(*tax, "tax");
    }

    scenario.validate();
    return scenario;
}

} // anonymous namespace

Scenario parse_scenario_json(const std::string& json_string) {
    json j;
    try {
        j = json::parse(json_string);
    } catch (const json::parse_error& e) {
        throw ConfigurationError("scenario", "invalid JSON: " + std::string(e.what()));
    }
    return parse_scenario(j);
}

Scenario load_scenario_json(std::istream& is) {
    json j;
    try {
        is >> j;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("scenario", "invalid JSON: " + std::string(e.what()));
    }
    return parse_scenario(j);
}

Scenario load_scenario_json(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw ConfigurationError("scenario", "failed to open scenario file: " + filepath);
    }
    return load_scenario_json(file);
}

} // namespace io
} // namespace nestegg
