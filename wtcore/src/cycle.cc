// Copyright (c) 2025 <Your Name>
#include "wtcore/cycle.hpp"

namespace wtcore {

namespace {

struct ElapsedVisitor {
  int operator()(const Work& w) const { return w.minutes + w.paused_minutes; }
  int operator()(const Break& b) const { return b.minutes; }
};

struct DurationVisitor {
  int operator()(const Work& w) const { return ElapsedVisitor()(w); }
  int operator()(const Break& b) const { return b.minutes; }
};

}  // namespace

int Elapsed(const Cycle& c) { return std::visit(ElapsedVisitor(), c); }

int Duration(const Cycle& c) { return std::visit(DurationVisitor(), c); }

}  // namespace wtcore
