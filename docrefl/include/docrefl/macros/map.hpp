// This file is modified from https://github.com/swansontec/map-macro/blob/master/map.h
#pragma once

#define DR_MACRO_IMPL_EVAL0(...) __VA_ARGS__
#define DR_MACRO_IMPL_EVAL1(...) DR_MACRO_IMPL_EVAL0(DR_MACRO_IMPL_EVAL0(DR_MACRO_IMPL_EVAL0(__VA_ARGS__)))
#define DR_MACRO_IMPL_EVAL2(...) DR_MACRO_IMPL_EVAL1(DR_MACRO_IMPL_EVAL1(DR_MACRO_IMPL_EVAL1(__VA_ARGS__)))
#define DR_MACRO_IMPL_EVAL3(...) DR_MACRO_IMPL_EVAL2(DR_MACRO_IMPL_EVAL2(DR_MACRO_IMPL_EVAL2(__VA_ARGS__)))
#define DR_MACRO_IMPL_EVAL4(...) DR_MACRO_IMPL_EVAL3(DR_MACRO_IMPL_EVAL3(DR_MACRO_IMPL_EVAL3(__VA_ARGS__)))
#define DR_MACRO_IMPL_EVAL(...)  DR_MACRO_IMPL_EVAL4(DR_MACRO_IMPL_EVAL4(DR_MACRO_IMPL_EVAL4(__VA_ARGS__)))

// Evaluate once, forcing one extra rescan of the result.
#define DR_EVAL_MACRO_ONCE(...) __VA_ARGS__
// Evaluate repeatedly, enough to unroll the deferred recursion used by `DR_SREFL`.
#define DR_EVAL_MACRO(...) DR_MACRO_IMPL_EVAL(__VA_ARGS__)

#define DR_EXPAND_ARGS(...) (__VA_ARGS__)
#define DR_PARENS ()
