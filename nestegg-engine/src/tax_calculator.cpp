#include "tax_calculator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace nestegg {

namespace {

double non_negative(double value) {
    return value > 0.0 ? value : 0.0;
}

void validate_band_list(const std::vector<TaxBand>& bands, const std::string& field) {
    for (size_t i = 0; i < bands.size(); ++i) {
        std::string path = field + "[" + std::to_string(i) + "]";
        const TaxBand& band = bands[i];
        if (!std::isfinite(band.threshold) || band.threshold < 0.0) {
            throw ConfigurationError(path + ".threshold", "must be a finite non-negative amount");
        }
        if (i > 0 && band.threshold <= bands[i - 1].threshold) {
            throw ConfigurationError(path + ".threshold", "thresholds must be strictly increasing");
        }
        if (!std::isfinite(band.rate) || band.rate < 0.0 || band.rate >= 1.0) {
            throw ConfigurationError(path + ".rate", "must be in [0, 1)");
        }
    }
}

} // anonymous namespace

// ============================================================================
// TaxBands
// ============================================================================

TaxBands::TaxBands()
    : cgt_annual_allowance(0.0)
    , cgt_rate(0.0)
    , pension_tax_free_fraction(0.25)
{}

TaxBands TaxBands::uk_2024() {
    TaxBands bands;
    bands.income_tax = {{12570.0, 0.20}, {50270.0, 0.40}, {125140.0, 0.45}};
    bands.national_insurance = {{12570.0, 0.08}, {50270.0, 0.02}};
    bands.cgt_annual_allowance = 3000.0;
    bands.cgt_rate = 0.10;
    bands.pension_tax_free_fraction = 0.25;
    return bands;
}

double TaxBands::personal_allowance() const {
    if (income_tax.empty()) {
        return std::numeric_limits<double>::infinity();
    }
    return income_tax.front().threshold;
}

bool TaxBands::operator==(const TaxBands& other) const {
    return income_tax == other.income_tax &&
           national_insurance == other.national_insurance &&
           cgt_annual_allowance == other.cgt_annual_allowance &&
           cgt_rate == other.cgt_rate &&
           pension_tax_free_fraction == other.pension_tax_free_fraction;
}

// ============================================================================
// TaxCalculator
// ============================================================================

TaxCalculator::TaxCalculator(TaxBands bands)
    : bands_(std::move(bands))
{
    validate_bands(bands_);
}

void TaxCalculator::validate_bands(const TaxBands& bands, const std::string& prefix) {
    validate_band_list(bands.income_tax, prefix + ".income_tax");
    validate_band_list(bands.national_insurance, prefix + ".national_insurance");

    if (!std::isfinite(bands.cgt_annual_allowance) || bands.cgt_annual_allowance < 0.0) {
        throw ConfigurationError(prefix + ".cgt_annual_allowance", "must be a finite non-negative amount");
    }
    if (!std::isfinite(bands.cgt_rate) || bands.cgt_rate < 0.0 || bands.cgt_rate >= 1.0) {
        throw ConfigurationError(prefix + ".cgt_rate", "must be in [0, 1)");
    }
    if (!std::isfinite(bands.pension_tax_free_fraction) ||
        bands.pension_tax_free_fraction < 0.0 || bands.pension_tax_free_fraction > 1.0) {
        throw ConfigurationError(prefix + ".pension_tax_free_fraction", "must be in [0, 1]");
    }
}

TaxCalculator TaxCalculator::indexed(double factor) const {
    if (!std::isfinite(factor) || factor <= 0.0) {
        throw ConfigurationError("assumptions.tax_band_indexation",
                                 "indexation factor must be finite and positive");
    }
    TaxBands scaled = bands_;
    for (auto& band : scaled.income_tax) {
        band.threshold *= factor;
    }
    for (auto& band : scaled.national_insurance) {
        band.threshold *= factor;
    }
    scaled.cgt_annual_allowance *= factor;
    return TaxCalculator(std::move(scaled));
}

double TaxCalculator::banded(const std::vector<TaxBand>& bands, double amount) {
    double total = 0.0;
    for (size_t i = 0; i < bands.size(); ++i) {
        double lower = bands[i].threshold;
        if (amount <= lower) {
            break;
        }
        double upper = (i + 1 < bands.size())
            ? bands[i + 1].threshold
            : std::numeric_limits<double>::infinity();
        total += (std::min(amount, upper) - lower) * bands[i].rate;
    }
    return total;
}

double TaxCalculator::income_tax(double taxable_income) const {
    return banded(bands_.income_tax, non_negative(taxable_income));
}

double TaxCalculator::marginal_income_tax(double base_taxable, double additional) const {
    double base = non_negative(base_taxable);
    double extra = non_negative(additional);
    if (extra == 0.0) {
        return 0.0;
    }
    return income_tax(base + extra) - income_tax(base);
}

double TaxCalculator::national_insurance(double gross_salary) const {
    return banded(bands_.national_insurance, non_negative(gross_salary));
}

SalaryTax TaxCalculator::salary(double gross, double employee_pension_contribution) const {
    SalaryTax result;
    result.gross = non_negative(gross);
    result.pension_deduction = std::min(non_negative(employee_pension_contribution), result.gross);
    result.taxable = result.gross - result.pension_deduction;
    result.income_tax = income_tax(result.taxable);
    result.national_insurance = national_insurance(result.taxable);
    result.net = result.gross - result.pension_deduction -
                 result.income_tax - result.national_insurance;
    return result;
}

DrawdownTax TaxCalculator::pension_drawdown(double gross, double base_taxable) const {
    DrawdownTax result;
    result.gross = non_negative(gross);
    result.tax_free = result.gross * bands_.pension_tax_free_fraction;
    result.taxable = result.gross - result.tax_free;
    result.tax = marginal_income_tax(base_taxable, result.taxable);
    result.net = result.gross - result.tax;
    return result;
}

DrawdownTax TaxCalculator::pension_drawdown_for_net(double net_target, double base_taxable,
                                                    double available) const {
    double target = non_negative(net_target);
    double pot = non_negative(available);
    double base = non_negative(base_taxable);
    if (target == 0.0 || pot == 0.0) {
        return pension_drawdown(0.0, base);
    }

    // Net per unit gross is constant within a band, so walk the bands from
    // the current taxable position until the target is covered.
    double taxable_share = 1.0 - bands_.pension_tax_free_fraction;
    double gross = 0.0;
    if (taxable_share <= 0.0) {
        gross = target;
    } else {
        double remaining = target;
        double position = base;
        while (remaining > 0.0) {
            double rate = 0.0;
            double next = std::numeric_limits<double>::infinity();
            for (const auto& band : bands_.income_tax) {
                if (band.threshold <= position) {
                    rate = band.rate;
                } else {
                    next = band.threshold;
                    break;
                }
            }
            double net_per_gross = 1.0 - taxable_share * rate;
            double segment_gross = (next - position) / taxable_share;
            double segment_net = segment_gross * net_per_gross;
            if (remaining <= segment_net) {
                gross += remaining / net_per_gross;
                break;
            }
            gross += segment_gross;
            remaining -= segment_net;
            position = next;
        }
    }

    return pension_drawdown(std::min(gross, pot), base);
}

GiaWithdrawalTax TaxCalculator::gia_withdrawal(double gross, double balance, double cost_basis,
                                               double allowance_remaining) const {
    GiaWithdrawalTax result;
    double holding = non_negative(balance);
    result.gross = std::min(non_negative(gross), holding);
    if (result.gross == 0.0) {
        return result;
    }

    double gain_fraction = non_negative(holding - non_negative(cost_basis)) / holding;
    result.gain_realized = result.gross * gain_fraction;
    result.allowance_used = std::min(result.gain_realized, non_negative(allowance_remaining));
    result.tax = (result.gain_realized - result.allowance_used) * bands_.cgt_rate;
    result.net = result.gross - result.tax;
    return result;
}

GiaWithdrawalTax TaxCalculator::gia_withdrawal_for_net(double net_target, double balance,
                                                       double cost_basis,
                                                       double allowance_remaining) const {
    double target = non_negative(net_target);
    double holding = non_negative(balance);
    if (target == 0.0 || holding == 0.0) {
        return gia_withdrawal(0.0, holding, cost_basis, allowance_remaining);
    }

    double gain_fraction = non_negative(holding - non_negative(cost_basis)) / holding;
    double allowance = non_negative(allowance_remaining);
    double rate = bands_.cgt_rate;

    double gross = target;
    if (target * gain_fraction > allowance) {
        gross = (target - rate * allowance) / (1.0 - rate * gain_fraction);
    }
    return gia_withdrawal(std::min(gross, holding), holding, cost_basis, allowance);
}

} // namespace nestegg
