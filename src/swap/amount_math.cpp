#include "swap/amount_math.hpp"

using boost::multiprecision::cpp_int;

Result<Uint256> ParseUnits(const std::string& human, int decimals) {
  if (decimals < 0 || decimals > 77) {
    return Result<Uint256>::Fail(SwapError::InvalidIntent, "unsupported decimals " + std::to_string(decimals));
  }
  auto dot = human.find('.');
  std::string whole = human.substr(0, dot);
  std::string frac = dot == std::string::npos ? std::string() : human.substr(dot + 1);
  auto digits_only = [](const std::string& s) {
    for (char c : s) if (c < '0' || c > '9') return false;
    return true;
  };
  if ((whole.empty() && frac.empty()) || !digits_only(whole) || !digits_only(frac)) {
    return Result<Uint256>::Fail(SwapError::InvalidIntent, "malformed amount '" + human + "'");
  }
  if (frac.size() > static_cast<size_t>(decimals)) frac.resize(static_cast<size_t>(decimals));
  frac.append(static_cast<size_t>(decimals) - frac.size(), '0');

  cpp_int value = 0;
  for (char c : whole + frac) {
    value *= 10;
    value += c - '0';
    if (value > cpp_int(MaxUint256())) {
      return Result<Uint256>::Fail(SwapError::InvalidIntent, "amount '" + human + "' exceeds uint256");
    }
  }
  return Uint256(value);
}

std::string FormatUnits(const Uint256& amount, int decimals) {
  std::string digits = ToDecimalString(amount);
  if (decimals <= 0) return digits;
  size_t d = static_cast<size_t>(decimals);
  if (digits.size() <= d) digits.insert(0, d - digits.size() + 1, '0');
  return digits.substr(0, digits.size() - d) + "." + digits.substr(digits.size() - d);
}

cpp_int Slippage::HundredPercent() const {
  cpp_int hundred = 100;
  for (unsigned int i = 0; i < digits; ++i) hundred *= 10;
  return hundred;
}

Result<Slippage> ParseSlippage(const std::string& percent) {
  auto dot = percent.find('.');
  std::string whole = percent.substr(0, dot);
  std::string frac = dot == std::string::npos ? std::string() : percent.substr(dot + 1);
  auto digits_only = [](const std::string& s) {
    for (char c : s) if (c < '0' || c > '9') return false;
    return true;
  };
  if ((whole.empty() && frac.empty()) || !digits_only(whole) || !digits_only(frac)) {
    return Result<Slippage>::Fail(SwapError::InvalidIntent, "malformed slippage '" + percent + "'");
  }
  while (!frac.empty() && frac.back() == '0') frac.pop_back();

  Slippage s;
  s.digits = static_cast<unsigned int>(frac.size());
  for (char c : whole + frac) {
    s.scaled *= 10;
    s.scaled += c - '0';
  }
  if (s.scaled >= s.HundredPercent()) {
    return Result<Slippage>::Fail(SwapError::InvalidIntent, "slippage must be in [0, 100), got " + percent);
  }
  return s;
}

Uint256 MinimumAmountOut(const Uint256& quoted, const Slippage& slippage) {
  const cpp_int hundred = slippage.HundredPercent();
  if (slippage.scaled >= hundred) return 0;
  cpp_int wide = cpp_int(quoted) * (hundred - slippage.scaled) / hundred;
  return Uint256(wide);
}
