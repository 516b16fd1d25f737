/**
 * Toy execution engine using execerr
 *
 * This example demonstrates:
 * - Raising coded errors from opcode handlers into a first_error latch
 * - Wrapping errors with frame context without losing their kind
 * - Branching on the latched kind after a run (revert vs abort)
 * - Recycling one latch across several traced runs
 *
 * Set EXECERR_TRACE=2 to see latched and dropped errors on stderr.
 */

#include <execerr/execerr.hpp>

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum class op : std::uint8_t { push, pop, add, jump, revert, halt };

struct machine {
  std::vector<std::uint64_t> stack;
  std::uint64_t gas{0};
  std::size_t pc{0};
};

constexpr std::size_t kMaxStack = 4;

auto step(machine& m, const std::vector<op>& code) -> execerr::result<bool> {
  using execerr::error_kind;
  if (m.gas == 0) return execerr::fail(error_kind::insufficient_gas, "gas exhausted");
  --m.gas;
  switch (code[m.pc]) {
    case op::push:
      if (m.stack.size() >= kMaxStack) {
        return execerr::fail(error_kind::data_stack_overflow, "push beyond " + std::to_string(kMaxStack));
      }
      m.stack.push_back(m.pc);
      break;
    case op::pop:
      if (m.stack.empty()) return execerr::fail(error_kind::data_stack_underflow, "pop on empty stack");
      m.stack.pop_back();
      break;
    case op::add: {
      if (m.stack.size() < 2) return execerr::fail(error_kind::data_stack_underflow, "add needs 2 operands");
      const auto a = m.stack.back(); m.stack.pop_back();
      m.stack.back() += a;
      break;
    }
    case op::jump: {
      const auto target = m.stack.empty() ? code.size() : m.stack.back();
      if (target >= code.size()) {
        return execerr::fail(error_kind::invalid_jump_dest, "jump to " + std::to_string(target));
      }
      m.pc = target;
      return true;
    }
    case op::revert:
      return execerr::fail(error_kind::execution_reverted, "revert at pc " + std::to_string(m.pc));
    case op::halt:
      return false;
  }
  ++m.pc;
  return m.pc < code.size();
}

void run(const std::string& name, const std::vector<op>& code, std::uint64_t gas,
         execerr::first_error& latch) {
  execerr::trace_scope scope(latch);
  machine m;
  m.gas = gas;
  while (true) {
    auto r = step(m, code);
    if (!r) {
      scope.sink().push_error(execerr::wrap(r, "frame 0"));
      // A downstream symptom of the first failure; the latch keeps the root cause.
      scope.sink().push_error(std::runtime_error("frame unwound"));
      break;
    }
    if (!*r) break;
  }

  const auto err = scope.provider().error();
  std::cout << name << ": ";
  if (!err) {
    std::cout << "ok, stack depth " << m.stack.size() << "\n";
  } else if (err->kind() == execerr::error_kind::execution_reverted) {
    std::cout << "reverted (" << err->message() << "), state changes kept for refund\n";
  } else {
    std::cout << "aborted: " << err->debug_string() << " [" << execerr::describe(err->kind()) << "]\n";
  }
}

} // namespace

int main() {
  execerr::first_error latch;

  run("clean", {op::push, op::push, op::add, op::halt}, 100, latch);
  run("underflow", {op::pop, op::halt}, 100, latch);
  run("out-of-gas", {op::push, op::push, op::add, op::halt}, 2, latch);
  run("revert", {op::push, op::revert}, 100, latch);
  run("overflow", {op::push, op::push, op::push, op::push, op::push, op::halt}, 100, latch);

  return 0;
}
