#include "host/execution_host.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

extern "C" {
#include "quickjs.h"
}

#include "utils/deterministic_utils.h"
#include "validator/rules.h"

namespace slotbox {

using Clock = std::chrono::steady_clock;

// Arrays copied into native code by utils
constexpr int64_t kMaxUtilArrayLength = int64_t{1} << 24;

constexpr size_t kMaxErrorMessageBytes = 4096;

// Trusted. Runs in every fresh context before slot code is compiled.
const char* const kRealmPrelude = R"JS(
(function (g) {
  'use strict';
  var lock = function (proto) {
    Object.defineProperty(proto, 'constructor', {
      value: undefined, writable: false, enumerable: false, configurable: false
    });
  };
  lock(Function.prototype);
  lock(Object.getPrototypeOf(function* () {}));
  lock(Object.getPrototypeOf(async function () {}));
  lock(Object.getPrototypeOf(async function* () {}));

  var names = ['abs', 'acos', 'acosh', 'asin', 'asinh', 'atan', 'atan2', 'atanh', 'cbrt',
    'ceil', 'clz32', 'cos', 'cosh', 'exp', 'expm1', 'floor', 'fround', 'hypot', 'imul',
    'log', 'log10', 'log1p', 'log2', 'max', 'min', 'pow', 'round', 'sign', 'sin', 'sinh',
    'sqrt', 'tan', 'tanh', 'trunc', 'E', 'LN10', 'LN2', 'LOG10E', 'LOG2E', 'PI',
    'SQRT1_2', 'SQRT2'];
  var safeMath = {};
  names.forEach(function (name) { safeMath[name] = Math[name]; });
  Object.defineProperty(g, 'Math', {
    value: Object.freeze(safeMath), writable: false, enumerable: false, configurable: false
  });

  ['eval', 'Function', 'Date', 'Atomics', 'SharedArrayBuffer', 'WebAssembly']
    .forEach(function (name) { delete g[name]; });
})(globalThis);
)JS";

// Shadowed in the slot scope on top of the validator blacklist
const char* const kShadowedExtras[] = {
    "setTimeout", "setInterval", "setImmediate", "clearTimeout", "clearInterval",
    "queueMicrotask", "postMessage", "Date"};

/**
 * Sloppy outer function so `eval` can be declared; the slot itself is strict.
 * Evaluates to the inner function.
 */
static std::string WrapSlotCode(const std::string& code) {
  std::string shadowed;
  auto add = [&shadowed](const std::string& name) {
    if (!shadowed.empty()) shadowed += ", ";
    shadowed += name + " = undefined";
  };
  for (const auto& name : rules::BlacklistedIdentifiers()) {
    if (name != "__proto__") add(name);
  }
  for (const char* name : kShadowedExtras) {
    add(name);
  }
  return fmt::format(
      "(function () {{\n"
      "var {};\n"
      "return function (input, params, utils) {{\n"
      "'use strict';\n"
      "{}\n"
      "}};\n"
      "}})()",
      shadowed, code);
}

// Per-call state reachable from the interrupt handler and utils
struct CallState {
  Clock::time_point deadline;
  bool interrupted = false;
  SeededRandom random;
};

static int InterruptHandler(JSRuntime* rt, void* opaque) {
  auto* state = static_cast<CallState*>(opaque);
  if (Clock::now() >= state->deadline) {
    state->interrupted = true;
    return 1;
  }
  return 0;
}

// Owns one JSValue reference
class ScopedValue {
 public:
  ScopedValue(JSContext* ctx, JSValue value) : ctx_(ctx), value_(value) {}
  ~ScopedValue() { JS_FreeValue(ctx_, value_); }

  ScopedValue(const ScopedValue&) = delete;
  ScopedValue& operator=(const ScopedValue&) = delete;

  JSValue get() const { return value_; }

 private:
  JSContext* ctx_;
  JSValue value_;
};

// Frees the per-call context and detaches the call state from the runtime
class ContextScope {
 public:
  ContextScope(JSRuntime* rt, JSContext* ctx) : rt_(rt), ctx_(ctx) {}
  ~ContextScope() {
    JS_FreeContext(ctx_);
    JS_SetInterruptHandler(rt_, nullptr, nullptr);
    JS_RunGC(rt_);
  }

  ContextScope(const ContextScope&) = delete;
  ContextScope& operator=(const ContextScope&) = delete;

 private:
  JSRuntime* rt_;
  JSContext* ctx_;
};

static std::string JsGetString(JSContext* ctx, JSValueConst val) {
  size_t len = 0;
  const char* str = JS_ToCStringLen(ctx, &len, val);
  if (!str) {
    JS_FreeValue(ctx, JS_GetException(ctx));
    return "";
  }
  std::string result(str, len);
  JS_FreeCString(ctx, str);
  return result;
}

// Keeps a thrown message well inside the response frame; cuts on a UTF-8
// boundary
static std::string TruncateMessage(std::string message) {
  if (message.size() <= kMaxErrorMessageBytes) {
    return message;
  }
  size_t cut = kMaxErrorMessageBytes;
  while (cut > 0 && (static_cast<unsigned char>(message[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  message.resize(cut);
  message += "...";
  return message;
}

// Error objects report their message; other thrown values their string form
static std::string TakeExceptionMessage(JSContext* ctx) {
  JSValue exc = JS_GetException(ctx);
  std::string message;
  if (JS_IsError(ctx, exc)) {
    JSValue msg = JS_GetPropertyStr(ctx, exc, "message");
    message = JsGetString(ctx, msg);
    JS_FreeValue(ctx, msg);
  } else {
    message = JsGetString(ctx, exc);
  }
  JS_FreeValue(ctx, exc);
  return message.empty() ? "Unknown error" : TruncateMessage(std::move(message));
}

// Structural copy: fresh JS values, no shared references back to the host
static JSValue JsonToJs(JSContext* ctx, const nlohmann::json& j) {
  switch (j.type()) {
    case nlohmann::json::value_t::boolean:
      return JS_NewBool(ctx, j.get<bool>());
    case nlohmann::json::value_t::number_integer:
      return JS_NewInt64(ctx, j.get<int64_t>());
    case nlohmann::json::value_t::number_unsigned: {
      uint64_t u = j.get<uint64_t>();
      if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return JS_NewInt64(ctx, static_cast<int64_t>(u));
      }
      return JS_NewFloat64(ctx, static_cast<double>(u));
    }
    case nlohmann::json::value_t::number_float:
      return JS_NewFloat64(ctx, j.get<double>());
    case nlohmann::json::value_t::string: {
      const auto& s = j.get_ref<const std::string&>();
      return JS_NewStringLen(ctx, s.data(), s.size());
    }
    case nlohmann::json::value_t::array: {
      JSValue arr = JS_NewArray(ctx);
      uint32_t i = 0;
      for (const auto& element : j) {
        JS_DefinePropertyValueUint32(ctx, arr, i++, JsonToJs(ctx, element), JS_PROP_C_W_E);
      }
      return arr;
    }
    case nlohmann::json::value_t::object: {
      JSValue obj = JS_NewObject(ctx);
      for (auto it = j.begin(); it != j.end(); ++it) {
        // Define, not set: a "__proto__" key stays an own property
        const std::string& key = it.key();
        JSAtom atom = JS_NewAtomLen(ctx, key.data(), key.size());
        JS_DefinePropertyValue(ctx, obj, atom, JsonToJs(ctx, it.value()), JS_PROP_C_W_E);
        JS_FreeAtom(ctx, atom);
      }
      return obj;
    }
    default:
      return JS_NULL;
  }
}

// ---------------------------------------------------------------------------
// utils bindings
// ---------------------------------------------------------------------------

enum class UtilFn {
  kSum,
  kMean,
  kMedian,
  kStdev,
  kMin,
  kMax,
  kQuantile,
  kClamp,
  kScale,
  kLog1p,
  kExp,
  kNow,
  kParseUtc,
  kRandom,
  kGroupBy,
  kRolling
};

struct UtilEntry {
  const char* name;
  int length;
  UtilFn fn;
};

// Index in this table is the `magic` of the bound function
const UtilEntry kUtilTable[] = {
    {"sum", 1, UtilFn::kSum},         {"mean", 1, UtilFn::kMean},
    {"median", 1, UtilFn::kMedian},   {"stdev", 1, UtilFn::kStdev},
    {"min", 1, UtilFn::kMin},         {"max", 1, UtilFn::kMax},
    {"quantile", 2, UtilFn::kQuantile}, {"clamp", 3, UtilFn::kClamp},
    {"scale", 5, UtilFn::kScale},     {"log1p", 1, UtilFn::kLog1p},
    {"exp", 1, UtilFn::kExp},         {"now", 0, UtilFn::kNow},
    {"parseUtc", 1, UtilFn::kParseUtc}, {"random", 0, UtilFn::kRandom},
    {"groupBy", 2, UtilFn::kGroupBy}, {"rolling", 3, UtilFn::kRolling},
};

static JSValueConst Arg(int argc, JSValueConst* argv, int index) {
  return index < argc ? argv[index] : JS_UNDEFINED;
}

// False with a pending exception when value is not an array
static bool ArrayLength(JSContext* ctx, JSValueConst value, const char* fn, uint32_t* length) {
  int is_array = JS_IsArray(ctx, value);
  if (is_array < 0) {
    return false;
  }
  if (!is_array) {
    JS_ThrowTypeError(ctx, "utils.%s expects an array", fn);
    return false;
  }
  JSValue len_val = JS_GetPropertyStr(ctx, value, "length");
  if (JS_IsException(len_val)) {
    return false;
  }
  int64_t len = 0;
  int rc = JS_ToInt64(ctx, &len, len_val);
  JS_FreeValue(ctx, len_val);
  if (rc < 0) {
    return false;
  }
  if (len > kMaxUtilArrayLength) {
    JS_ThrowRangeError(ctx, "utils.%s: array too long", fn);
    return false;
  }
  *length = static_cast<uint32_t>(len);
  return true;
}

// Elements go through JavaScript ToNumber
static bool ReadNumbers(JSContext* ctx, JSValueConst value, const char* fn,
                        std::vector<double>* out) {
  uint32_t length = 0;
  if (!ArrayLength(ctx, value, fn, &length)) {
    return false;
  }
  out->reserve(length);
  for (uint32_t i = 0; i < length; ++i) {
    JSValue element = JS_GetPropertyUint32(ctx, value, i);
    if (JS_IsException(element)) {
      return false;
    }
    double d = 0.0;
    int rc = JS_ToFloat64(ctx, &d, element);
    JS_FreeValue(ctx, element);
    if (rc < 0) {
      return false;
    }
    out->push_back(d);
  }
  return true;
}

static bool ReadNumberArgs(JSContext* ctx, int argc, JSValueConst* argv, int first, int count,
                           double* out) {
  for (int i = 0; i < count; ++i) {
    if (JS_ToFloat64(ctx, &out[i], Arg(argc, argv, first + i)) < 0) {
      return false;
    }
  }
  return true;
}

// Buckets in first-seen key order; releases anything not handed to the result
class GroupBuckets {
 public:
  explicit GroupBuckets(JSContext* ctx) : ctx_(ctx) {}
  ~GroupBuckets() {
    for (auto& bucket : buckets_) {
      JS_FreeAtom(ctx_, bucket.key);
      JS_FreeValue(ctx_, bucket.items);
    }
  }

  GroupBuckets(const GroupBuckets&) = delete;
  GroupBuckets& operator=(const GroupBuckets&) = delete;

  // Takes ownership of key
  bool Add(JSAtom key, JSValueConst item) {
    auto it = index_.find(key);
    Bucket* bucket = nullptr;
    if (it == index_.end()) {
      index_[key] = buckets_.size();
      buckets_.push_back(Bucket{key, JS_NewArray(ctx_), 0});
      bucket = &buckets_.back();
    } else {
      JS_FreeAtom(ctx_, key);
      bucket = &buckets_[it->second];
    }
    return JS_DefinePropertyValueUint32(ctx_, bucket->items, bucket->count++,
                                        JS_DupValue(ctx_, item), JS_PROP_C_W_E) >= 0;
  }

  JSValue Build() {
    JSValue groups = JS_NewObject(ctx_);
    for (auto& bucket : buckets_) {
      JSValue items = bucket.items;
      bucket.items = JS_UNDEFINED;
      if (JS_DefinePropertyValue(ctx_, groups, bucket.key, items, JS_PROP_C_W_E) < 0) {
        JS_FreeValue(ctx_, groups);
        return JS_EXCEPTION;
      }
    }
    return groups;
  }

 private:
  struct Bucket {
    JSAtom key;
    JSValue items;
    uint32_t count;
  };

  JSContext* ctx_;
  std::vector<Bucket> buckets_;
  std::map<JSAtom, size_t> index_;
};

// utils.groupBy(arr, keyFn): { [String(keyFn(item))]: item[] }
static JSValue GroupBy(JSContext* ctx, JSValueConst arr, JSValueConst key_fn) {
  uint32_t length = 0;
  if (!ArrayLength(ctx, arr, "groupBy", &length)) {
    return JS_EXCEPTION;
  }
  if (!JS_IsFunction(ctx, key_fn)) {
    return JS_ThrowTypeError(ctx, "utils.groupBy expects a key function");
  }
  GroupBuckets buckets(ctx);
  for (uint32_t i = 0; i < length; ++i) {
    ScopedValue item(ctx, JS_GetPropertyUint32(ctx, arr, i));
    if (JS_IsException(item.get())) {
      return JS_EXCEPTION;
    }
    JSValue item_val = item.get();
    JSValue key = JS_Call(ctx, key_fn, JS_UNDEFINED, 1, &item_val);
    if (JS_IsException(key)) {
      return JS_EXCEPTION;
    }
    JSAtom atom = JS_ValueToAtom(ctx, key);
    JS_FreeValue(ctx, key);
    if (atom == JS_ATOM_NULL) {
      return JS_EXCEPTION;
    }
    if (!buckets.Add(atom, item.get())) {
      return JS_EXCEPTION;
    }
  }
  return buckets.Build();
}

// Effective trailing window for a JS window argument: slice(max(0, i - w + 1), i + 1)
static size_t EffectiveWindow(double window, uint32_t length) {
  if (std::isnan(window) || window >= static_cast<double>(length)) {
    return length;
  }
  if (window <= 0) {
    return 0;
  }
  return static_cast<size_t>(std::ceil(window));
}

// utils.rolling(arr, window, fn): [fn(arr.slice(max(0, i - window + 1), i + 1)) for each i]
static JSValue Rolling(JSContext* ctx, JSValueConst arr, JSValueConst window_val,
                       JSValueConst fn) {
  uint32_t length = 0;
  if (!ArrayLength(ctx, arr, "rolling", &length)) {
    return JS_EXCEPTION;
  }
  double window = 0.0;
  if (JS_ToFloat64(ctx, &window, window_val) < 0) {
    return JS_EXCEPTION;
  }
  if (!JS_IsFunction(ctx, fn)) {
    return JS_ThrowTypeError(ctx, "utils.rolling expects a function");
  }

  JSValue result = JS_NewArray(ctx);
  uint32_t out_index = 0;
  for (const auto& [start, end] : utils::RollingWindows(length, EffectiveWindow(window, length))) {
    JSValue slice = JS_NewArray(ctx);
    for (size_t j = start; j < end; ++j) {
      JSValue element = JS_GetPropertyUint32(ctx, arr, static_cast<uint32_t>(j));
      if (JS_IsException(element) ||
          JS_DefinePropertyValueUint32(ctx, slice, static_cast<uint32_t>(j - start), element,
                                       JS_PROP_C_W_E) < 0) {
        JS_FreeValue(ctx, slice);
        JS_FreeValue(ctx, result);
        return JS_EXCEPTION;
      }
    }
    JSValue value = JS_Call(ctx, fn, JS_UNDEFINED, 1, &slice);
    JS_FreeValue(ctx, slice);
    if (JS_IsException(value) ||
        JS_DefinePropertyValueUint32(ctx, result, out_index++, value, JS_PROP_C_W_E) < 0) {
      JS_FreeValue(ctx, result);
      return JS_EXCEPTION;
    }
  }
  return result;
}

static double Reduce(UtilFn fn, const std::vector<double>& values) {
  switch (fn) {
    case UtilFn::kSum: return utils::Sum(values);
    case UtilFn::kMean: return utils::Mean(values);
    case UtilFn::kMedian: return utils::Median(values);
    case UtilFn::kStdev: return utils::Stdev(values);
    case UtilFn::kMin: return utils::Min(values);
    case UtilFn::kMax: return utils::Max(values);
    default: return std::numeric_limits<double>::quiet_NaN();
  }
}

static JSValue JsUtilsCall(JSContext* ctx, JSValueConst this_val, int argc, JSValueConst* argv,
                           int magic, JSValue* func_data) {
  const UtilEntry& entry = kUtilTable[magic];
  auto* state = static_cast<CallState*>(JS_GetContextOpaque(ctx));

  switch (entry.fn) {
    case UtilFn::kSum:
    case UtilFn::kMean:
    case UtilFn::kMedian:
    case UtilFn::kStdev:
    case UtilFn::kMin:
    case UtilFn::kMax: {
      std::vector<double> values;
      if (!ReadNumbers(ctx, Arg(argc, argv, 0), entry.name, &values)) {
        return JS_EXCEPTION;
      }
      return JS_NewFloat64(ctx, Reduce(entry.fn, values));
    }
    case UtilFn::kQuantile: {
      std::vector<double> values;
      double q = 0.0;
      if (!ReadNumbers(ctx, Arg(argc, argv, 0), entry.name, &values) ||
          !ReadNumberArgs(ctx, argc, argv, 1, 1, &q)) {
        return JS_EXCEPTION;
      }
      return JS_NewFloat64(ctx, utils::Quantile(values, q));
    }
    case UtilFn::kClamp: {
      double a[3];
      if (!ReadNumberArgs(ctx, argc, argv, 0, 3, a)) return JS_EXCEPTION;
      return JS_NewFloat64(ctx, utils::Clamp(a[0], a[1], a[2]));
    }
    case UtilFn::kScale: {
      double a[5];
      if (!ReadNumberArgs(ctx, argc, argv, 0, 5, a)) return JS_EXCEPTION;
      return JS_NewFloat64(ctx, utils::Scale(a[0], a[1], a[2], a[3], a[4]));
    }
    case UtilFn::kLog1p:
    case UtilFn::kExp: {
      double x = 0.0;
      if (!ReadNumberArgs(ctx, argc, argv, 0, 1, &x)) return JS_EXCEPTION;
      return JS_NewFloat64(ctx, entry.fn == UtilFn::kLog1p ? utils::Log1p(x) : utils::Exp(x));
    }
    case UtilFn::kNow:
      return JS_NewFloat64(ctx, utils::Now());
    case UtilFn::kParseUtc: {
      size_t len = 0;
      const char* str = JS_ToCStringLen(ctx, &len, Arg(argc, argv, 0));
      if (!str) return JS_EXCEPTION;
      std::string date(str, len);
      JS_FreeCString(ctx, str);
      return JS_NewFloat64(ctx, utils::ParseUtc(date));
    }
    case UtilFn::kRandom:
      return JS_NewFloat64(ctx, state->random.Next());
    case UtilFn::kGroupBy:
      return GroupBy(ctx, Arg(argc, argv, 0), Arg(argc, argv, 1));
    case UtilFn::kRolling:
      return Rolling(ctx, Arg(argc, argv, 0), Arg(argc, argv, 1), Arg(argc, argv, 2));
  }
  return JS_UNDEFINED;
}

// Non-writable, non-configurable members on a non-extensible object
static JSValue MakeUtils(JSContext* ctx) {
  JSValue obj = JS_NewObject(ctx);
  int index = 0;
  for (const auto& entry : kUtilTable) {
    JSValue fn = JS_NewCFunctionData(ctx, JsUtilsCall, entry.length, index++, 0, nullptr);
    JS_DefinePropertyValueStr(ctx, obj, entry.name, fn, JS_PROP_ENUMERABLE);
  }
  JS_PreventExtensions(ctx, obj);
  return obj;
}

// ---------------------------------------------------------------------------
// ExecutionHost
// ---------------------------------------------------------------------------

class ExecutionHost::Impl {
 public:
  explicit Impl(const SandboxConfig& config) {
    rt = JS_NewRuntime();
    if (!rt) {
      throw std::runtime_error("Failed to create QuickJS runtime");
    }
    // 0 leaves the engine unlimited
    if (config.memory_limit_bytes > 0) {
      JS_SetMemoryLimit(rt, static_cast<size_t>(config.memory_limit_bytes));
    }
    JS_SetMaxStackSize(rt, static_cast<size_t>(config.stack_limit_bytes));
  }

  ~Impl() {
    if (rt) JS_FreeRuntime(rt);
  }

  JSRuntime* rt = nullptr;
};

ExecutionHost::ExecutionHost(const SandboxConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

ExecutionHost::~ExecutionHost() = default;

SlotResult ExecutionHost::Execute(const SlotRequest& request) {
  JSRuntime* rt = impl_->rt;

  CallState state;
  state.deadline =
      Clock::now() + std::chrono::milliseconds(std::min(request.timeout_ms, kMaxTimeoutMs));

  JSContext* ctx = JS_NewContext(rt);
  if (!ctx) {
    throw std::runtime_error("Failed to create QuickJS context");
  }
  JS_SetInterruptHandler(rt, InterruptHandler, &state);
  ContextScope scope(rt, ctx);
  JS_SetContextOpaque(ctx, &state);

  auto fail = [&](std::string message) {
    if (state.interrupted) {
      return SlotResult::Failure(ErrorKind::kExecutionTimeout, "Execution timeout",
                                 Phase::kExecution);
    }
    return SlotResult::Failure(ErrorKind::kExecutionError, std::move(message), Phase::kExecution);
  };

  {
    ScopedValue prelude(ctx, JS_Eval(ctx, kRealmPrelude, std::strlen(kRealmPrelude), "<prelude>",
                                     JS_EVAL_TYPE_GLOBAL));
    if (JS_IsException(prelude.get())) {
      std::string message = TakeExceptionMessage(ctx);
      if (state.interrupted) {
        return fail(message);
      }
      throw std::runtime_error("Realm hardening failed: " + message);
    }
  }

  auto compile_start = Clock::now();
  std::string source = WrapSlotCode(request.code);
  ScopedValue fn(ctx, JS_Eval(ctx, source.data(), source.size(), "<slot>", JS_EVAL_TYPE_GLOBAL));
  if (JS_IsException(fn.get())) {
    return fail(TakeExceptionMessage(ctx));
  }
  if (!JS_IsFunction(ctx, fn.get())) {
    return fail("Slot code must be a single function body");
  }

  ScopedValue input(ctx, JsonToJs(ctx, request.input));
  ScopedValue params(ctx, JsonToJs(ctx, request.params));
  ScopedValue utils_obj(ctx, MakeUtils(ctx));
  if (JS_IsException(input.get()) || JS_IsException(params.get()) ||
      JS_IsException(utils_obj.get())) {
    return fail(TakeExceptionMessage(ctx));
  }

  JSValue args[3] = {input.get(), params.get(), utils_obj.get()};
  ScopedValue result(ctx, JS_Call(ctx, fn.get(), JS_UNDEFINED, 3, args));
  if (JS_IsException(result.get())) {
    return fail(TakeExceptionMessage(ctx));
  }

  // JSON.stringify semantics: cycles and BigInt throw, undefined -> null
  ScopedValue serialized(ctx, JS_JSONStringify(ctx, result.get(), JS_UNDEFINED, JS_UNDEFINED));
  if (JS_IsException(serialized.get())) {
    return fail(TakeExceptionMessage(ctx));
  }
  nlohmann::json data = nullptr;
  if (!JS_IsUndefined(serialized.get())) {
    try {
      data = nlohmann::json::parse(JsGetString(ctx, serialized.get()));
    } catch (const nlohmann::json::parse_error& e) {
      return fail(fmt::format("Result is not JSON-serializable: {}", e.what()));
    }
  }

  double exec_time_ms =
      std::chrono::duration<double, std::milli>(Clock::now() - compile_start).count();
  return SlotResult::Success(std::move(data), exec_time_ms);
}

}  // namespace slotbox
