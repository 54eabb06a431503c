/**
 * tillpoint-cli: replay a scripted POS terminal session against a CSV catalog.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/tillpoint_cli --catalog products.csv [--config path] [--journal path] [--script path]
 * The script is read from stdin when --script is not given. Time is virtual:
 * it only moves on "wait <ms>".
 */

#include <tillpoint/app/config.hpp>
#include <tillpoint/app/logging.hpp>
#include <tillpoint/app/terminal.hpp>
#include <tillpoint/core/clock.hpp>
#include <tillpoint/core/error.hpp>
#include <tillpoint/core/money.hpp>
#include <tillpoint/core/transaction.hpp>
#include <tillpoint/scan/key_event.hpp>
#include <tillpoint/scan/screen.hpp>
#include <tillpoint/store/csv_catalog.hpp>
#include <tillpoint/store/csv_transaction_journal.hpp>
#include <tillpoint/store/in_memory_catalog_store.hpp>
#include <tillpoint/store/in_memory_transaction_store.hpp>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace {

namespace ta = tillpoint::app;
namespace tc = tillpoint::core;
namespace ts = tillpoint::scan;

std::optional<long long> parse_int(const std::string& text) {
  long long value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

void print_cart(const ta::Terminal& terminal) {
  const auto& cart = terminal.cart();
  if (cart.empty()) {
    std::cout << "  (cart empty)\n";
    return;
  }
  for (const auto& line : cart.lines()) {
    std::cout << "  " << line.product_id << "  " << line.name << "  x" << line.quantity << "  "
              << tc::format_amount(line.line_total()) << "\n";
  }
  const auto totals = cart.totals();
  std::cout << "  subtotal=" << tc::format_amount(totals.subtotal)
            << " tax=" << tc::format_amount(totals.tax)
            << " total=" << tc::format_amount(totals.total) << "\n";
}

/// Advances virtual time in 1 ms steps so timers fire at their own deadlines.
void wait_for(tc::ManualClock& clock, ta::Terminal& terminal, long long ms) {
  for (long long i = 0; i < ms; ++i) {
    clock.advance(tc::Millis{1});
    terminal.tick();
  }
}

/// Returns false on an unknown or malformed command.
bool run_command(const std::string& line, tc::ManualClock& clock, ta::Terminal& terminal) {
  std::istringstream in(line);
  std::string cmd;
  in >> cmd;
  if (cmd.empty() || cmd[0] == '#') return true;

  if (cmd == "keys") {
    std::string chars;
    std::getline(in >> std::ws, chars);
    for (const char c : chars) terminal.on_key(ts::key_char(c));
  } else if (cmd == "enter") {
    terminal.on_key(ts::key_enter());
  } else if (cmd == "wait") {
    std::string ms;
    in >> ms;
    const auto parsed = parse_int(ms);
    if (!parsed || *parsed < 0) return false;
    wait_for(clock, terminal, *parsed);
  } else if (cmd == "screen") {
    std::string name;
    in >> name;
    const auto screen = ts::parse_screen(name);
    if (!screen) return false;
    terminal.navigate(*screen);
  } else if (cmd == "scan") {
    std::string token;
    in >> token;
    if (token.empty()) return false;
    (void)terminal.manual_scan(token);
  } else if (cmd == "add") {
    std::string id;
    in >> id;
    (void)terminal.add_product(id);
  } else if (cmd == "qty") {
    std::string id;
    std::string qty;
    in >> id >> qty;
    const auto parsed = parse_int(qty);
    if (!parsed) return false;
    (void)terminal.update_quantity(id, static_cast<std::int32_t>(*parsed));
  } else if (cmd == "remove") {
    std::string id;
    in >> id;
    terminal.remove_from_cart(id);
  } else if (cmd == "pay") {
    std::string method;
    std::string value;
    in >> method >> value;
    const auto parsed = tc::parse_payment_method(method);
    if (!parsed) return false;
    auto& payment = terminal.payment();
    payment.method = *parsed;
    if (*parsed == tc::PaymentMethod::Cash) payment.received_amount = value;
    else payment.reference_number = value;
  } else if (cmd == "checkout") {
    auto receipt = terminal.checkout();
    if (receipt) {
      const auto& t = receipt->transaction;
      std::cout << "  " << t.id << " " << t.timestamp << " total=" << tc::format_amount(t.total)
                << " received=" << tc::format_amount(t.received_amount)
                << " change=" << tc::format_amount(t.change) << "\n";
    }
  } else if (cmd == "cart") {
    print_cart(terminal);
  } else if (cmd == "suspend") {
    terminal.suspend_scanning();
  } else if (cmd == "resume") {
    terminal.resume_scanning();
  } else if (cmd == "retry") {
    const auto resolved = terminal.retry_inventory_reconciliation();
    std::cout << "  resolved=" << resolved << " pending=" << terminal.ledger().pending().size() << "\n";
  } else {
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string catalog_path;
  std::string journal_override;
  std::string script_path;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--catalog" && i + 1 < argc) {
      catalog_path = argv[++i];
    } else if (arg == "--journal" && i + 1 < argc) {
      journal_override = argv[++i];
    } else if (arg == "--script" && i + 1 < argc) {
      script_path = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: tillpoint_cli --catalog <csv> [options]\n"
                << "  --config <path>   Terminal config (key=value file); default: built-in\n"
                << "  --catalog <path>  Product catalog CSV (id,name,price,quantity[,barcode,...])\n"
                << "  --journal <path>  Transaction journal CSV (overrides transaction_journal_path)\n"
                << "  --script <path>   Session script; default: stdin\n"
                << "\nScript commands: keys <chars> | enter | wait <ms> | screen <name> | scan <token>\n"
                << "  add <id> | qty <id> <n> | remove <id> | pay cash <amount> | pay card|gcash <ref>\n"
                << "  checkout | cart | suspend | resume | retry\n";
      return 0;
    }
  }

  try {
    ta::TerminalConfig cfg = config_path.empty() ? ta::default_config() : ta::load_config(config_path);
    if (!journal_override.empty()) cfg.transaction_journal_path = journal_override;
    ta::init_logging(cfg.log_level);

    if (catalog_path.empty()) {
      throw std::runtime_error("--catalog is required");
    }
    auto products = tillpoint::store::load_catalog_csv(catalog_path);
    if (!products) {
      throw std::runtime_error("cannot load catalog " + catalog_path + ": " +
                               std::string(tc::describe(products.error())));
    }
    tillpoint::store::InMemoryCatalogStore catalog(std::move(*products));

    std::unique_ptr<tillpoint::store::ITransactionStore> transactions;
    if (cfg.transaction_journal_path.empty()) {
      transactions = std::make_unique<tillpoint::store::InMemoryTransactionStore>();
    } else {
      transactions = std::make_unique<tillpoint::store::CsvTransactionJournal>(cfg.transaction_journal_path);
    }

    tc::ManualClock clock;
    ta::Terminal terminal(cfg, catalog, *transactions, clock);
    terminal.on_notification([](const ta::Notification& n) {
      std::cout << "[" << ta::to_string(n.severity) << "] " << n.message << "\n";
    });
    if (!terminal.start()) return 1;

    std::ifstream script_file;
    if (!script_path.empty()) {
      script_file.open(script_path);
      if (!script_file) throw std::runtime_error("cannot open script " + script_path);
    }
    std::istream& script = script_path.empty() ? std::cin : script_file;

    std::string line;
    int line_no = 0;
    while (std::getline(script, line)) {
      ++line_no;
      if (!run_command(line, clock, terminal)) {
        std::cerr << "line " << line_no << ": cannot run '" << line << "'\n";
      }
    }
    // flush a trailing scan burst
    wait_for(clock, terminal, static_cast<long long>(cfg.scan_inactivity_ms));
  } catch (const std::exception& e) {
    spdlog::critical("[cli] {}", e.what());
    return 1;
  }
  return 0;
}
