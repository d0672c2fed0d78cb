#include "cronwork/scheduler/cron.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <format>
#include <optional>
#include <ranges>
#include <span>
#include <utility>

namespace cronwork {
namespace {

// Long enough to cover any Feb 29 fire across a skipped century leap year.
constexpr int kHorizonYears = 10;

constexpr std::array<std::pair<std::string_view, std::string_view>, 7> kMacros{{
    {"@yearly", "0 0 1 1 *"},
    {"@annually", "0 0 1 1 *"},
    {"@monthly", "0 0 1 * *"},
    {"@weekly", "0 0 * * 0"},
    {"@daily", "0 0 * * *"},
    {"@midnight", "0 0 * * *"},
    {"@hourly", "0 * * * *"},
}};

constexpr std::array<std::string_view, 12> kMonthNames{
    "jan", "feb", "mar", "apr", "may", "jun",
    "jul", "aug", "sep", "oct", "nov", "dec"};

constexpr std::array<std::string_view, 7> kDowNames{"sun", "mon", "tue", "wed",
                                                    "thu", "fri", "sat"};

struct FieldSpec {
  std::string_view name;
  int min_val;
  int max_val;
  // Largest accepted literal; weekday accepts 7 as a second Sunday.
  int max_literal;
  std::span<const std::string_view> names;
  int first_name_value;
  bool allow_last;
};

constexpr FieldSpec kMinuteSpec{"minute", 0, 59, 59, {}, 0, false};
constexpr FieldSpec kHourSpec{"hour", 0, 23, 23, {}, 0, false};
constexpr FieldSpec kDomSpec{"day-of-month", 1, 31, 31, {}, 0, true};
constexpr FieldSpec kMonthSpec{"month", 1, 12, 12, kMonthNames, 1, false};
constexpr FieldSpec kDowSpec{"weekday", 0, 6, 7, kDowNames, 0, false};

constexpr auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

auto trim(std::string_view s) -> std::string_view {
  auto start = std::ranges::find_if_not(s, is_space);
  auto end = std::ranges::find_if_not(s | std::views::reverse, is_space);
  if (start == s.end())
    return {};
  return {start, end.base()};
}

auto iequals(std::string_view a, std::string_view b) noexcept -> bool {
  return std::ranges::equal(a, b, [](char ca, char cb) {
    return std::tolower(static_cast<unsigned char>(ca)) ==
           std::tolower(static_cast<unsigned char>(cb));
  });
}

// Unlike a whitespace tokenizer this keeps empty pieces, so "1,,2" and a
// trailing comma are visible to the caller.
auto split_keep_empty(std::string_view s, char delim)
    -> std::vector<std::string_view> {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    auto pos = s.find(delim, start);
    if (pos == std::string_view::npos) {
      parts.push_back(s.substr(start));
      return parts;
    }
    parts.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }
}

auto split_ws(std::string_view s) -> std::vector<std::string_view> {
  std::vector<std::string_view> tokens;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && is_space(static_cast<unsigned char>(s[i])))
      ++i;
    std::size_t start = i;
    while (i < s.size() && !is_space(static_cast<unsigned char>(s[i])))
      ++i;
    if (i > start)
      tokens.push_back(s.substr(start, i - start));
  }
  return tokens;
}

auto all_digits(std::string_view s) -> bool {
  return !s.empty() && std::ranges::all_of(s, [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

auto parse_uint(std::string_view s) -> std::optional<int> {
  if (!all_digits(s))
    return std::nullopt;
  int value = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec == std::errc{} && ptr == s.data() + s.size()) {
    return value;
  }
  return std::nullopt;
}

struct Value {
  int value;
  bool named;
};

auto parse_value(std::string_view s, const FieldSpec& spec, std::string& why)
    -> std::optional<Value> {
  if (s.empty()) {
    why = std::format("missing value in {} field", spec.name);
    return std::nullopt;
  }
  if (s.front() == '-') {
    why = std::format("negative value '{}' in {} field", s, spec.name);
    return std::nullopt;
  }
  if (auto v = parse_uint(s)) {
    if (*v < spec.min_val || *v > spec.max_literal) {
      why = std::format("value {} out of range {}-{} in {} field", *v,
                        spec.min_val, spec.max_literal, spec.name);
      return std::nullopt;
    }
    return Value{*v, false};
  }
  for (std::size_t i = 0; i < spec.names.size(); ++i) {
    if (iequals(s, spec.names[i])) {
      return Value{spec.first_name_value + static_cast<int>(i), true};
    }
  }
  why = std::format("invalid value '{}' in {} field", s, spec.name);
  return std::nullopt;
}

struct FieldResult {
  bool restricted{true};
  bool last{false};
};

template <std::size_t N>
auto parse_field(std::string_view field, const FieldSpec& spec,
                 std::bitset<N>& bs, FieldResult& out, std::string& why)
    -> bool {
  bs.reset();
  out = FieldResult{};

  auto set_value = [&](int v) {
    if (v == 7 && spec.max_literal == 7)
      v = 0;
    bs.set(static_cast<std::size_t>(v));
  };

  auto items = split_keep_empty(field, ',');
  for (auto item : items) {
    if (item.empty()) {
      why = std::format("empty list item in {} field '{}'", spec.name, field);
      return false;
    }

    int step = 1;
    bool has_step = false;
    std::string_view base = item;
    if (auto slash = item.find('/'); slash != std::string_view::npos) {
      auto step_str = item.substr(slash + 1);
      auto step_opt = parse_uint(step_str);
      if (!step_opt || *step_opt <= 0) {
        why = std::format("invalid step '{}' in {} field", step_str,
                          spec.name);
        return false;
      }
      step = *step_opt;
      has_step = true;
      base = item.substr(0, slash);
      if (base.empty()) {
        why = std::format("missing range before '/' in {} field", spec.name);
        return false;
      }
    }

    if (base == "*" || base == "?") {
      if (items.size() == 1 && step == 1) {
        out.restricted = false;
      }
      for (int v = spec.min_val; v <= spec.max_val; v += step) {
        set_value(v);
      }
      continue;
    }

    if (base == "L" || base == "l") {
      if (!spec.allow_last) {
        why = "'L' is only valid in the day-of-month field";
        return false;
      }
      if (has_step) {
        why = "'L' cannot take a step";
        return false;
      }
      out.last = true;
      continue;
    }

    int start = 0;
    int end = 0;
    bool wrap = false;
    if (auto dash = base.find('-'); dash != std::string_view::npos) {
      auto lhs = base.substr(0, dash);
      auto rhs = base.substr(dash + 1);
      if (lhs.empty()) {
        why = all_digits(rhs)
                  ? std::format("negative value '{}' in {} field", base,
                                spec.name)
                  : std::format("incomplete range '{}' in {} field", base,
                                spec.name);
        return false;
      }
      if (rhs.empty()) {
        why = std::format("incomplete range '{}' in {} field", base,
                          spec.name);
        return false;
      }
      auto a = parse_value(lhs, spec, why);
      if (!a)
        return false;
      auto b = parse_value(rhs, spec, why);
      if (!b)
        return false;
      start = a->value;
      end = b->value;
      if (start > end) {
        // Only named ranges wrap (fri-mon, nov-feb); numeric ones must ascend.
        if (!a->named && !b->named) {
          why = std::format("inverted range '{}' in {} field", base,
                            spec.name);
          return false;
        }
        wrap = true;
      }
    } else {
      auto v = parse_value(base, spec, why);
      if (!v)
        return false;
      start = v->value;
      end = has_step ? spec.max_val : v->value;
      if (start > end) {
        // 7/n on the weekday field
        end = start;
      }
    }

    if (!wrap) {
      for (int v = start; v <= end; v += step) {
        set_value(v);
      }
      continue;
    }
    int span = (spec.max_val - start + 1) + (end - spec.min_val + 1);
    for (int i = 0; i < span; i += step) {
      int v = start + i;
      if (v > spec.max_val)
        v = spec.min_val + (v - spec.max_val - 1);
      set_value(v);
    }
  }

  if (!bs.any() && !out.last) {
    why = std::format("{} field '{}' selects nothing", spec.name, field);
    return false;
  }
  return true;
}

constexpr auto max_days_in_month(int month) -> int {
  constexpr std::array<int, 12> days{31, 29, 31, 30, 31, 30,
                                     31, 31, 30, 31, 30, 31};
  return days[static_cast<std::size_t>(month - 1)];
}

auto days_in_month(int year, int month) -> int {
  auto last = std::chrono::year{year} / std::chrono::month{
                                            static_cast<unsigned>(month)} /
              std::chrono::last;
  return static_cast<int>(static_cast<unsigned>(last.day()));
}

template <std::size_t N>
auto next_set(const std::bitset<N>& bs, int from, int max_val)
    -> std::optional<int> {
  auto range = std::views::iota(from, max_val + 1);
  auto it = std::ranges::find_if(
      range, [&bs](int v) { return bs.test(static_cast<std::size_t>(v)); });
  if (it != range.end()) {
    return *it;
  }
  return std::nullopt;
}

auto parse_fields(std::string_view expr, std::string& why)
    -> std::optional<CronExpr::Fields> {
  auto trimmed = trim(expr);
  if (trimmed.empty()) {
    why = "empty expression";
    return std::nullopt;
  }

  std::string_view to_parse = trimmed;
  if (trimmed.front() == '@') {
    auto it = std::ranges::find_if(kMacros, [&](const auto& m) {
      return iequals(trimmed, m.first);
    });
    if (it == kMacros.end()) {
      why = std::format("unknown alias '{}'", trimmed);
      return std::nullopt;
    }
    to_parse = it->second;
  }

  auto tokens = split_ws(to_parse);
  if (tokens.size() != 5) {
    why = std::format("expected 5 fields, got {}", tokens.size());
    return std::nullopt;
  }

  CronExpr::Fields f{};
  FieldResult r;
  if (!parse_field(tokens[0], kMinuteSpec, f.minute, r, why))
    return std::nullopt;
  if (!parse_field(tokens[1], kHourSpec, f.hour, r, why))
    return std::nullopt;
  if (!parse_field(tokens[2], kDomSpec, f.dom, r, why))
    return std::nullopt;
  f.dom_restricted = r.restricted;
  f.dom_last = r.last;
  if (!parse_field(tokens[3], kMonthSpec, f.month, r, why))
    return std::nullopt;
  if (!parse_field(tokens[4], kDowSpec, f.dow, r, why))
    return std::nullopt;
  f.dow_restricted = r.restricted;

  if (f.dom_restricted && !f.dom_last) {
    bool possible = false;
    for (int m = 1; m <= 12 && !possible; ++m) {
      if (!f.month.test(static_cast<std::size_t>(m)))
        continue;
      for (int d = 1; d <= max_days_in_month(m); ++d) {
        if (f.dom.test(static_cast<std::size_t>(d))) {
          possible = true;
          break;
        }
      }
    }
    if (!possible) {
      why = std::format("day-of-month '{}' never occurs in month '{}'",
                        tokens[2], tokens[3]);
      return std::nullopt;
    }
  }

  return f;
}

}  // namespace

CronExpr::CronExpr(std::string raw, Fields fields)
    : raw_(std::move(raw)), fields_(std::move(fields)) {
}

auto CronExpr::parse(std::string_view expr) -> Result<CronExpr> {
  auto trimmed = trim(expr);
  if (trimmed.empty())
    return fail(Error::InvalidArgument);

  std::string why;
  auto fields = parse_fields(trimmed, why);
  if (!fields)
    return fail(Error::ParseError);
  return ok(CronExpr(std::string(trimmed), std::move(*fields)));
}

auto CronExpr::explain(std::string_view expr) -> std::string {
  std::string why;
  if (parse_fields(expr, why)) {
    return {};
  }
  return why;
}

auto CronExpr::day_matches(std::chrono::year_month_day ymd) const -> bool {
  auto d = static_cast<unsigned>(ymd.day());
  bool dom_ok = fields_.dom.test(d);
  if (fields_.dom_last) {
    auto last = (ymd.year() / ymd.month() / std::chrono::last).day();
    dom_ok = dom_ok || ymd.day() == last;
  }
  auto wd = std::chrono::weekday{std::chrono::sys_days{ymd}}.c_encoding();
  bool dow_ok = fields_.dow.test(wd);

  if (!fields_.dom_restricted && !fields_.dow_restricted)
    return true;
  if (!fields_.dom_restricted)
    return dow_ok;
  if (!fields_.dow_restricted)
    return dom_ok;
  return dom_ok || dow_ok;
}

auto CronExpr::matches(TimePoint tp) const -> bool {
  using namespace std::chrono;
  auto day_start = floor<days>(tp);
  year_month_day ymd{day_start};
  auto tod = duration_cast<minutes>(tp - day_start).count();
  return fields_.month.test(static_cast<unsigned>(ymd.month())) &&
         day_matches(ymd) &&
         fields_.hour.test(static_cast<std::size_t>(tod / 60)) &&
         fields_.minute.test(static_cast<std::size_t>(tod % 60));
}

auto CronExpr::next_after(TimePoint after) const -> TimePoint {
  using namespace std::chrono;

  auto t = floor<minutes>(after) + minutes{1};
  auto day_start = floor<days>(t);
  year_month_day ymd{day_start};
  auto tod = duration_cast<minutes>(t - day_start).count();

  int y = static_cast<int>(ymd.year());
  int mo = static_cast<int>(static_cast<unsigned>(ymd.month()));
  int d = static_cast<int>(static_cast<unsigned>(ymd.day()));
  int h = static_cast<int>(tod / 60);
  int mi = static_cast<int>(tod % 60);

  const int max_year = y + kHorizonYears;

  auto next_month = [&] {
    if (++mo > 12) {
      mo = 1;
      ++y;
    }
    d = 1;
    h = mi = 0;
  };

  while (y <= max_year) {
    if (!fields_.month.test(static_cast<std::size_t>(mo))) {
      if (auto m = next_set(fields_.month, mo + 1, 12)) {
        mo = *m;
      } else {
        ++y;
        mo = *next_set(fields_.month, 1, 12);
      }
      d = 1;
      h = mi = 0;
      continue;
    }

    const int dim = days_in_month(y, mo);
    std::optional<int> day;
    for (int dd = d; dd <= dim; ++dd) {
      auto candidate = std::chrono::year{y} /
                       std::chrono::month{static_cast<unsigned>(mo)} /
                       std::chrono::day{static_cast<unsigned>(dd)};
      if (day_matches(candidate)) {
        day = dd;
        break;
      }
    }
    if (!day) {
      next_month();
      continue;
    }
    if (*day != d) {
      d = *day;
      h = mi = 0;
    }

    auto hour = next_set(fields_.hour, h, 23);
    if (!hour) {
      ++d;
      h = mi = 0;
      continue;
    }
    if (*hour != h) {
      h = *hour;
      mi = 0;
    }

    auto minute = next_set(fields_.minute, mi, 59);
    if (!minute) {
      mi = 0;
      if (++h > 23) {
        h = 0;
        ++d;
      }
      continue;
    }

    auto date = std::chrono::year{y} /
                std::chrono::month{static_cast<unsigned>(mo)} /
                std::chrono::day{static_cast<unsigned>(d)};
    return sys_days{date} + hours{h} + minutes{*minute};
  }

  return TimePoint::max();
}

auto CronExpr::all_between(TimePoint start, TimePoint end,
                           std::size_t max_count) const
    -> std::vector<TimePoint> {
  std::vector<TimePoint> result;
  result.reserve(std::min(max_count, std::size_t{64}));

  auto current = start - std::chrono::seconds(1);
  while (result.size() < max_count) {
    current = next_after(current);
    if (current >= end || current == TimePoint::max()) {
      break;
    }
    result.push_back(current);
  }

  return result;
}

}  // namespace cronwork
