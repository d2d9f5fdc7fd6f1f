#ifndef NESTEGG_TAX_CALCULATOR_HPP
#define NESTEGG_TAX_CALCULATOR_HPP

#include <string>
#include <vector>

namespace nestegg {

/**
 * @brief One marginal band: rate applies to income above threshold,
 * up to the next band's threshold
 */
struct TaxBand {
    double threshold;
    double rate;

    bool operator==(const TaxBand& other) const {
        return threshold == other.threshold && rate == other.rate;
    }
};

/**
 * @brief Tax-band table for one tax year
 *
 * The first income tax threshold is the personal allowance. Thresholds
 * must be strictly increasing and rates in [0, 1).
 */
struct TaxBands {
    std::vector<TaxBand> income_tax;
    std::vector<TaxBand> national_insurance;
    double cgt_annual_allowance;
    double cgt_rate;
    double pension_tax_free_fraction;

    TaxBands();

    /** UK 2024/25 rates: 20/40/45% income tax, 8/2% employee NI, 10% CGT */
    static TaxBands uk_2024();

    double personal_allowance() const;

    bool operator==(const TaxBands& other) const;
};

struct SalaryTax {
    double gross = 0.0;
    double pension_deduction = 0.0;
    double taxable = 0.0;
    double income_tax = 0.0;
    double national_insurance = 0.0;
    double net = 0.0;
};

struct DrawdownTax {
    double gross = 0.0;
    double tax_free = 0.0;
    double taxable = 0.0;
    double tax = 0.0;
    double net = 0.0;
};

struct GiaWithdrawalTax {
    double gross = 0.0;
    double gain_realized = 0.0;
    double allowance_used = 0.0;
    double tax = 0.0;
    double net = 0.0;
};

/**
 * @brief Pure tax functions over a validated band table
 *
 * Construction validates the table and throws ConfigurationError on a
 * malformed one. All functions clamp negative amounts to zero and are
 * safe to call concurrently.
 */
class TaxCalculator {
public:
    explicit TaxCalculator(TaxBands bands = TaxBands::uk_2024());

    /** Calculator with every threshold and the CGT allowance scaled by factor */
    TaxCalculator indexed(double factor) const;

    double income_tax(double taxable_income) const;

    /** Tax on additional income stacked on top of base_taxable */
    double marginal_income_tax(double base_taxable, double additional) const;

    double national_insurance(double gross_salary) const;

    /** Employee pension contribution is deducted before both income tax and NI */
    SalaryTax salary(double gross, double employee_pension_contribution) const;

    /** Gross pension withdrawal: tax-free fraction untaxed, remainder stacked on base_taxable */
    DrawdownTax pension_drawdown(double gross, double base_taxable) const;

    /** Smallest gross withdrawal yielding net_target, capped at available */
    DrawdownTax pension_drawdown_for_net(double net_target, double base_taxable,
                                         double available) const;

    /** GIA sale with gains realised pro rata to the unrealised gain fraction */
    GiaWithdrawalTax gia_withdrawal(double gross, double balance, double cost_basis,
                                    double allowance_remaining) const;

    GiaWithdrawalTax gia_withdrawal_for_net(double net_target, double balance,
                                            double cost_basis,
                                            double allowance_remaining) const;

    const TaxBands& bands() const { return bands_; }

    /** Throws ConfigurationError naming the first offending field under prefix */
    static void validate_bands(const TaxBands& bands, const std::string& prefix = "tax");

private:
    static double banded(const std::vector<TaxBand>& bands, double amount);

    TaxBands bands_;
};

} // namespace nestegg

#endif // NESTEGG_TAX_CALCULATOR_HPP
