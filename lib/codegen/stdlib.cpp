// tova/codegen/stdlib.cpp - Standard library fragment table
#include "tova/codegen/stdlib.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace tova::codegen::stdlib
{

namespace
{

std::vector<Fragment> build_table()
{
  std::vector<Fragment> t;
  auto add = [&t](std::string_view name, std::string_view code,
                  std::vector<std::string_view> deps = {}) {
    t.push_back(Fragment{name, code, std::move(deps)});
  };

  // ---------------------------------------------------------------------------
  // Result and Option
  // ---------------------------------------------------------------------------

  add("None", R"js(const None = Object.freeze({ __tag: "None", map(_) { return None; }, flatMap(_) { return None; }, andThen(_) { return None; }, unwrap() { throw new Error("Called unwrap on None"); }, unwrapOr(def) { return def; }, expect(msg) { throw new Error(msg); }, isSome() { return false; }, isNone() { return true; }, or(other) { return other; }, and(_) { return None; }, filter(_) { return None; } });)js");

  add("Ok", R"js(class _Ok { constructor(value) { this.value = value; } }
_Ok.prototype.__tag = "Ok";
_Ok.prototype.map = function(fn) { return new _Ok(fn(this.value)); };
_Ok.prototype.flatMap = function(fn) { const r = fn(this.value); if (r && r.__tag) return r; throw new Error("flatMap callback must return Ok/Err"); };
_Ok.prototype.andThen = _Ok.prototype.flatMap;
_Ok.prototype.unwrap = function() { return this.value; };
_Ok.prototype.unwrapOr = function(_) { return this.value; };
_Ok.prototype.expect = function(_) { return this.value; };
_Ok.prototype.isOk = function() { return true; };
_Ok.prototype.isErr = function() { return false; };
_Ok.prototype.mapErr = function(_) { return this; };
_Ok.prototype.unwrapErr = function() { throw new Error("Called unwrapErr on Ok"); };
_Ok.prototype.or = function(_) { return this; };
_Ok.prototype.and = function(other) { return other; };
function Ok(value) { return new _Ok(value); })js");

  add("Err", R"js(class _Err { constructor(error) { this.error = error; } }
_Err.prototype.__tag = "Err";
_Err.prototype.map = function(_) { return this; };
_Err.prototype.flatMap = function(_) { return this; };
_Err.prototype.andThen = _Err.prototype.flatMap;
_Err.prototype.unwrap = function() { throw new Error("Called unwrap on Err: " + (typeof this.error === "object" ? JSON.stringify(this.error) : this.error)); };
_Err.prototype.unwrapOr = function(def) { return def; };
_Err.prototype.expect = function(msg) { throw new Error(msg); };
_Err.prototype.isOk = function() { return false; };
_Err.prototype.isErr = function() { return true; };
_Err.prototype.mapErr = function(fn) { return new _Err(fn(this.error)); };
_Err.prototype.unwrapErr = function() { return this.error; };
_Err.prototype.or = function(other) { return other; };
_Err.prototype.and = function(_) { return this; };
function Err(error) { return new _Err(error); })js");

  add("Some", R"js(class _Some { constructor(value) { this.value = value; } }
_Some.prototype.__tag = "Some";
_Some.prototype.map = function(fn) { return new _Some(fn(this.value)); };
_Some.prototype.flatMap = function(fn) { const r = fn(this.value); if (r && r.__tag) return r; throw new Error("flatMap callback must return Some/None"); };
_Some.prototype.andThen = _Some.prototype.flatMap;
_Some.prototype.unwrap = function() { return this.value; };
_Some.prototype.unwrapOr = function(_) { return this.value; };
_Some.prototype.expect = function(_) { return this.value; };
_Some.prototype.isSome = function() { return true; };
_Some.prototype.isNone = function() { return false; };
_Some.prototype.or = function(_) { return this; };
_Some.prototype.and = function(other) { return other; };
_Some.prototype.filter = function(pred) { return pred(this.value) ? this : None; };
function Some(value) { return new _Some(value); })js",
      {"None"});

  // ---------------------------------------------------------------------------
  // I/O and collections
  // ---------------------------------------------------------------------------

  add("print", R"js(function print(...args) { console.log(...args); })js");
  add("len", R"js(function len(v) { if (v == null) return 0; if (typeof v === 'string' || Array.isArray(v) || ArrayBuffer.isView(v)) return v.length; if (typeof v === 'object') return Object.keys(v).length; return 0; })js");
  add("range", R"js(function range(s, e, st) { if (e === undefined) { e = s; s = 0; } if (st === undefined) st = s < e ? 1 : -1; if (st === 0) return []; const r = []; if (st > 0) { for (let i = s; i < e; i += st) r.push(i); } else { for (let i = s; i > e; i += st) r.push(i); } return r; })js");
  add("enumerate", R"js(function enumerate(a) { return a.map((v, i) => [i, v]); })js");
  add("sum", R"js(function sum(a) { return a.reduce((x, y) => x + y, 0); })js");
  add("sorted", R"js(function sorted(a, k) { const c = [...a]; if (k) c.sort((x, y) => { const kx = k(x), ky = k(y); return kx < ky ? -1 : kx > ky ? 1 : 0; }); else if (c.length > 0 && typeof c[0] === 'number') c.sort((x, y) => x - y); else c.sort((x, y) => x < y ? -1 : x > y ? 1 : 0); return c; })js");
  add("reversed", R"js(function reversed(a) { return [...a].reverse(); })js");
  add("zip", R"js(function zip(...as) { if (as.length === 0) return []; const m = Math.min(...as.map(a => a.length)); const r = []; for (let i = 0; i < m; i++) r.push(as.map(a => a[i])); return r; })js");
  add("min", R"js(function min(a) { if (a.length === 0) return null; let m = a[0]; for (let i = 1; i < a.length; i++) if (a[i] < m) m = a[i]; return m; })js");
  add("max", R"js(function max(a) { if (a.length === 0) return null; let m = a[0]; for (let i = 1; i < a.length; i++) if (a[i] > m) m = a[i]; return m; })js");
  add("filter", R"js(function filter(arr, fn) { return arr.filter(fn); })js");
  add("map", R"js(function map(arr, fn) { return arr.map(fn); })js");
  add("find", R"js(function find(arr, fn) { return arr.find(fn) ?? null; })js");
  add("any", R"js(function any(arr, fn) { return arr.some(fn); })js");
  add("all", R"js(function all(arr, fn) { return arr.every(fn); })js");
  add("flat_map", R"js(function flat_map(arr, fn) { return arr.flatMap(fn); })js");
  add("reduce", R"js(function reduce(arr, fn, init) { return init === undefined ? arr.reduce(fn) : arr.reduce(fn, init); })js");
  add("unique", R"js(function unique(arr) { return [...new Set(arr)]; })js");
  add("group_by", R"js(function group_by(arr, fn) { const r = {}; for (const v of arr) { const k = fn(v); if (!r[k]) r[k] = []; r[k].push(v); } return r; })js");
  add("chunk", R"js(function chunk(arr, n) { const r = []; for (let i = 0; i < arr.length; i += n) r.push(arr.slice(i, i + n)); return r; })js");
  add("flatten", R"js(function flatten(arr) { return arr.flat(); })js");
  add("take", R"js(function take(arr, n) { return arr.slice(0, n); })js");
  add("drop", R"js(function drop(arr, n) { return arr.slice(n); })js");
  add("first", R"js(function first(arr) { return arr.length > 0 ? arr[0] : null; })js");
  add("last", R"js(function last(arr) { return arr.length > 0 ? arr[arr.length - 1] : null; })js");
  add("count", R"js(function count(arr, fn) { return arr.filter(fn).length; })js");
  add("partition", R"js(function partition(arr, fn) { const y = [], n = []; for (const v of arr) { (fn(v) ? y : n).push(v); } return [y, n]; })js");

  // ---------------------------------------------------------------------------
  // Math
  // ---------------------------------------------------------------------------

  add("abs", R"js(function abs(n) { return Math.abs(n); })js");
  add("floor", R"js(function floor(n) { return Math.floor(n); })js");
  add("ceil", R"js(function ceil(n) { return Math.ceil(n); })js");
  add("round", R"js(function round(n) { return Math.round(n); })js");
  add("clamp", R"js(function clamp(n, lo, hi) { return Math.min(Math.max(n, lo), hi); })js");
  add("sqrt", R"js(function sqrt(n) { return Math.sqrt(n); })js");
  add("pow", R"js(function pow(b, e) { return Math.pow(b, e); })js");
  add("random", R"js(function random() { return Math.random(); })js");

  // ---------------------------------------------------------------------------
  // Strings
  // ---------------------------------------------------------------------------

  add("upper", R"js(function upper(s) { return s.toUpperCase(); })js");
  add("lower", R"js(function lower(s) { return s.toLowerCase(); })js");
  add("trim", R"js(function trim(s) { return s.trim(); })js");
  add("split", R"js(function split(s, sep) { return s.split(sep); })js");
  add("join", R"js(function join(arr, sep) { return arr.join(sep); })js");
  add("replace", R"js(function replace(s, from, to) { return typeof from === 'string' ? s.replaceAll(from, to) : s.replace(from, to); })js");
  add("repeat", R"js(function repeat(s, n) { return s.repeat(n); })js");
  add("contains", R"js(function contains(s, sub) { return s.includes(sub); })js");
  add("starts_with", R"js(function starts_with(s, prefix) { return s.startsWith(prefix); })js");
  add("ends_with", R"js(function ends_with(s, suffix) { return s.endsWith(suffix); })js");
  add("chars", R"js(function chars(s) { return [...s]; })js");
  add("words", R"js(function words(s) { return s.split(/\s+/).filter(Boolean); })js");
  add("lines", R"js(function lines(s) { return s.split('\n'); })js");
  add("capitalize", R"js(function capitalize(s) { return s.length ? s.charAt(0).toUpperCase() + s.slice(1) : s; })js");

  // ---------------------------------------------------------------------------
  // Objects
  // ---------------------------------------------------------------------------

  add("keys", R"js(function keys(obj) { return Object.keys(obj); })js");
  add("values", R"js(function values(obj) { return Object.values(obj); })js");
  add("entries", R"js(function entries(obj) { return Object.entries(obj); })js");
  add("merge", R"js(function merge(...objs) { return Object.assign({}, ...objs); })js");
  add("freeze", R"js(function freeze(obj) { return Object.freeze(obj); })js");
  add("clone", R"js(function clone(obj) { return structuredClone(obj); })js");

  // ---------------------------------------------------------------------------
  // Conversions and misc
  // ---------------------------------------------------------------------------

  add("sleep", R"js(function sleep(ms) { return new Promise(r => setTimeout(r, ms)); })js");
  add("type_of", R"js(function type_of(v) { if (v === null || v === undefined) return 'Nil'; if (Array.isArray(v)) return 'List'; if (v.__tag) return v.__tag; switch (typeof v) { case 'number': return Number.isInteger(v) ? 'Int' : 'Float'; case 'string': return 'String'; case 'boolean': return 'Bool'; case 'function': return 'Function'; case 'object': return 'Object'; default: return 'Unknown'; } })js");
  add("toInt", R"js(function toInt(v) { if (typeof v === 'boolean') return v ? 1 : 0; const n = typeof v === 'string' ? parseInt(v, 10) : Math.trunc(Number(v)); return isNaN(n) ? null : n; })js");
  add("toFloat", R"js(function toFloat(v) { if (typeof v === 'boolean') return v ? 1.0 : 0.0; const n = Number(v); return isNaN(n) ? null : n; })js");
  add("toString", R"js(function toString(v) { if (v == null) return 'nil'; if (v.__tag) return v.__tag + (v.value !== undefined ? '(' + String(v.value) + ')' : ''); return String(v); })js");
  add("assert", R"js(function assert(cond, msg) { if (!cond) throw new Error(msg || "Assertion failed"); })js");
  add("assert_eq", R"js(function assert_eq(a, b, msg) { if (a !== b) throw new Error(msg || `Assertion failed: ${JSON.stringify(a)} !== ${JSON.stringify(b)}`); })js");

  // ---------------------------------------------------------------------------
  // Classes and namespaces
  // ---------------------------------------------------------------------------

  add("Counter", R"js(class Counter {
  constructor(items) { this._counts = new Map(); if (items) { for (const item of items) { this._counts.set(item, (this._counts.get(item) || 0) + 1); } } }
  count(item) { return this._counts.get(item) || 0; }
  total() { let s = 0; for (const v of this._counts.values()) s += v; return s; }
  most_common(n) { const sorted = [...this._counts.entries()].sort((a, b) => b[1] - a[1]); return n !== undefined ? sorted.slice(0, n) : sorted; }
  keys() { return [...this._counts.keys()]; }
  values() { return [...this._counts.values()]; }
  entries() { return [...this._counts.entries()]; }
  has(item) { return this._counts.has(item); }
  get length() { return this._counts.size; }
  [Symbol.iterator]() { return this._counts[Symbol.iterator](); }
  toString() { return 'Counter(' + this._counts.size + ' items)'; }
})js");

  add("DefaultDict", R"js(class DefaultDict {
  constructor(defaultFn) { this._map = new Map(); this._default = defaultFn; }
  get(key) { if (!this._map.has(key)) { this._map.set(key, this._default()); } return this._map.get(key); }
  set(key, value) { this._map.set(key, value); return this; }
  has(key) { return this._map.has(key); }
  delete(key) { this._map.delete(key); return this; }
  keys() { return [...this._map.keys()]; }
  values() { return [...this._map.values()]; }
  entries() { return [...this._map.entries()]; }
  get length() { return this._map.size; }
  [Symbol.iterator]() { return this._map[Symbol.iterator](); }
  toString() { return 'DefaultDict(' + this._map.size + ' entries)'; }
})js");

  add("Deque", R"js(class Deque {
  constructor(items) { this._items = items ? [...items] : []; }
  push_back(val) { return new Deque([...this._items, val]); }
  push_front(val) { return new Deque([val, ...this._items]); }
  pop_back() { if (this._items.length === 0) return [null, this]; return [this._items[this._items.length - 1], new Deque(this._items.slice(0, -1))]; }
  pop_front() { if (this._items.length === 0) return [null, this]; return [this._items[0], new Deque(this._items.slice(1))]; }
  peek_front() { return this._items.length > 0 ? this._items[0] : null; }
  peek_back() { return this._items.length > 0 ? this._items[this._items.length - 1] : null; }
  get length() { return this._items.length; }
  toArray() { return [...this._items]; }
  [Symbol.iterator]() { return this._items[Symbol.iterator](); }
  toString() { return 'Deque(' + this._items.length + ' items)'; }
})js");

  add("json", R"js(const json = Object.freeze({
  parse(s) { try { return Ok(JSON.parse(s)); } catch (e) { return Err(e.message); } },
  stringify(v) { return JSON.stringify(v); },
  pretty(v) { return JSON.stringify(v, null, 2); }
});)js",
      {"Ok", "Err"});

  add("collections", R"js(const collections = Object.freeze({ DefaultDict, Counter, Deque });)js",
      {"DefaultDict", "Counter", "Deque"});

  // ---------------------------------------------------------------------------
  // Runtime helpers
  // ---------------------------------------------------------------------------

  add("__contains", R"js(function __contains(col, val) {
  if (Array.isArray(col) || typeof col === 'string') return col.includes(val);
  if (col instanceof Set || col instanceof Map) return col.has(val);
  if (typeof col === 'object' && col !== null) return val in col;
  return false;
})js");

  add("__TovaPropagate", R"js(class __TovaPropagate { constructor(value) { this.value = value; } })js");

  add("__propagate", R"js(function __propagate(val) {
  if (val && (val.__tag === "Err" || val.__tag === "None")) throw new __TovaPropagate(val);
  if (val && (val.__tag === "Ok" || val.__tag === "Some")) return val.value;
  return val;
})js",
      {"__TovaPropagate"});

  add("__spawn", R"js(async function __spawn(task) {
  try { return Ok(await task()); } catch (e) { return Err(e); }
})js",
      {"Ok", "Err"});

  add("__gather_cancel_on_error", R"js(function __gather_cancel_on_error(tasks) {
  return new Promise((resolve) => {
    const results = new Array(tasks.length);
    let pending = tasks.length;
    let settled = false;
    if (pending === 0) { resolve(results); return; }
    tasks.forEach((task, i) => task.then((r) => {
      if (settled) return;
      results[i] = r;
      if (r && r.__tag === "Err") {
        settled = true;
        for (let j = 0; j < results.length; j++) if (results[j] === undefined) results[j] = r;
        resolve(results);
      } else if (--pending === 0) {
        settled = true;
        resolve(results);
      }
    }));
  });
})js");

  add("__gather_first", R"js(function __gather_first(tasks) {
  return Promise.race(tasks).then((r) => tasks.map(() => r));
})js");

  add("__with_timeout", R"js(function __with_timeout(gathered, ms, count) {
  let timer;
  const expired = new Promise((resolve) => {
    timer = setTimeout(() => resolve(Array.from({ length: count }, () => Err("timeout"))), ms);
  });
  return Promise.race([gathered, expired]).finally(() => clearTimeout(timer));
})js",
      {"Err"});

  return t;
}

}  // namespace

const std::vector<Fragment> & fragments()
{
  static const std::vector<Fragment> table = build_table();
  return table;
}

const Fragment * find(std::string_view name)
{
  static const std::unordered_map<std::string_view, const Fragment *> index = [] {
    std::unordered_map<std::string_view, const Fragment *> m;
    for (const auto & f : fragments()) m.emplace(f.name, &f);
    return m;
  }();
  auto it = index.find(name);
  return it == index.end() ? nullptr : it->second;
}

bool is_user_visible(std::string_view name)
{
  return find(name) != nullptr && name.substr(0, 2) != "__";
}

std::vector<std::string_view> resolve(const std::set<std::string> & used)
{
  std::vector<std::string_view> order;
  std::unordered_set<std::string_view> visited;

  // Post-order DFS; dependency lists are acyclic by construction.
  auto visit = [&](auto & self, const Fragment & f) -> void {
    if (!visited.insert(f.name).second) return;
    for (const auto dep : f.deps) {
      if (const Fragment * d = find(dep)) self(self, *d);
    }
    order.push_back(f.name);
  };

  for (const auto & f : fragments()) {
    if (used.count(std::string(f.name)) != 0) visit(visit, f);
  }
  return order;
}

std::string emit(const std::set<std::string> & used)
{
  std::string out;
  for (const auto name : resolve(used)) {
    if (!out.empty()) out += '\n';
    out += find(name)->code;
  }
  return out;
}

}  // namespace tova::codegen::stdlib
