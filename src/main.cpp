/**
 * @file main.cpp
 * @brief Line-oriented driver for the bourse exchange
 *
 * Reads one command per line from stdin and prints the outcome to stdout.
 * Users are addressed by the name they registered with.
 *
 *   user <name>                          instrument <ticker> [kind]
 *   deluser <name>                       delist <ticker>
 *   deposit <user> <ticker> <amount>     withdraw <user> <ticker> <amount>
 *   limit <user> <buy|sell> <ticker> <qty> <price>
 *   market <user> <buy|sell> <ticker> <qty>
 *   cancel <user> <order-id>             order <user> <order-id>
 *   orders <user>                        balances <user>
 *   book <ticker> [depth]                trades <ticker> [limit]
 *   instruments                          quit
 */

#include "bourse/config.hpp"
#include "bourse/exchange.hpp"
#include "bourse/logger.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace bourse {

namespace {

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool parse_int(const std::string& text, int64_t& out) {
    try {
        size_t consumed = 0;
        out = std::stoll(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

void print_error(const std::error_code& error) {
    std::cout << "error: " << to_string(error_kind(error)) << ": " << error.message() << "\n";
}

void print_order(const Order& order) {
    std::cout << order.id << " " << to_string(order.side) << " " << to_string(order.type) << " "
              << order.ticker << " qty=" << order.quantity << " filled=" << order.filled_quantity;
    if (order.price) {
        std::cout << " price=" << *order.price;
    }
    std::cout << " " << to_string(order.status) << "\n";
}

void print_report(const OrderReport& report) {
    std::cout << report.order.id << " " << to_string(report.order.side) << " "
              << report.order.ticker << " remaining=" << report.remaining_quantity
              << " " << to_string(report.order.status);
    if (report.average_execution_price) {
        std::cout << " avg=" << *report.average_execution_price;
    }
    std::cout << "\n";
}

class CommandShell {
public:
    explicit CommandShell(Exchange& exchange) : exchange_(exchange) {}

    // Returns false once the session should end
    bool execute(const std::string& line) {
        std::istringstream in(line);
        std::vector<std::string> args;
        for (std::string word; in >> word;) {
            args.push_back(word);
        }
        if (args.empty() || args[0][0] == '#') return true;

        const std::string& command = args[0];
        if (command == "quit" || command == "exit") return false;

        if (command == "user" && args.size() == 2) {
            handle_user(args[1]);
        } else if (command == "deluser" && args.size() == 2) {
            with_user(args[1], [&](const User& user) { report(exchange_.delete_user(user.id)); });
        } else if (command == "instrument" && (args.size() == 2 || args.size() == 3)) {
            auto added = exchange_.add_instrument(args[1], args.size() == 3 ? args[2] : "EQUITY");
            if (added.has_error()) print_error(added.error());
            else std::cout << "listed " << added.value().ticker << "\n";
        } else if (command == "delist" && args.size() == 2) {
            report(exchange_.delete_instrument(args[1]));
        } else if (command == "instruments") {
            for (const auto& instrument : exchange_.list_instruments()) {
                std::cout << instrument.ticker << " " << instrument.kind << "\n";
            }
        } else if ((command == "deposit" || command == "withdraw") && args.size() == 4) {
            handle_adjust(args, command == "withdraw");
        } else if (command == "limit" && args.size() == 6) {
            handle_submit(args, OrderType::LIMIT);
        } else if (command == "market" && args.size() == 5) {
            handle_submit(args, OrderType::MARKET);
        } else if ((command == "cancel" || command == "order") && args.size() == 3) {
            handle_order_lookup(args, command == "cancel");
        } else if (command == "orders" && args.size() == 2) {
            with_user(args[1], [&](const User& user) {
                auto reports = exchange_.list_orders(user.id);
                if (reports.has_error()) return print_error(reports.error());
                for (const auto& entry : reports.value()) print_report(entry);
            });
        } else if (command == "balances" && args.size() == 2) {
            with_user(args[1], [&](const User& user) {
                auto balances = exchange_.get_balances(user.id);
                if (balances.has_error()) return print_error(balances.error());
                for (const auto& [ticker, amount] : balances.value()) {
                    std::cout << ticker << " " << amount << "\n";
                }
            });
        } else if ((command == "book" || command == "trades") && (args.size() == 2 || args.size() == 3)) {
            handle_market_data(args, command == "book");
        } else {
            std::cout << "error: unrecognised command: " << SecurityUtils::sanitize_log_input(line) << "\n";
        }
        return true;
    }

private:
    Exchange& exchange_;

    template<typename F>
    void with_user(const std::string& name, F&& action) {
        auto user = exchange_.find_user_by_name(name);
        if (!user) {
            print_error(make_error_code(ErrorCode::USER_NOT_FOUND));
            return;
        }
        action(*user);
    }

    void report(const Result<void>& result) {
        if (result.has_error()) print_error(result.error());
        else std::cout << "ok\n";
    }

    void handle_user(const std::string& name) {
        auto user = exchange_.register_user(name);
        if (user.has_error()) return print_error(user.error());
        std::cout << user.value().id << "\n";
    }

    void handle_adjust(const std::vector<std::string>& args, bool withdraw) {
        int64_t amount = 0;
        if (!parse_int(args[3], amount) || amount <= 0) {
            return print_error(make_error_code(ErrorCode::INVALID_AMOUNT));
        }
        with_user(args[1], [&](const User& user) {
            auto result = exchange_.adjust_balance(user.id, args[2], withdraw ? -amount : amount);
            if (result.has_error()) return print_error(result.error());
            std::cout << upper(args[2]) << " " << result.value() << "\n";
        });
    }

    void handle_submit(const std::vector<std::string>& args, OrderType type) {
        auto side = parse_side(upper(args[2]));
        if (!side) {
            std::cout << "error: side must be buy or sell\n";
            return;
        }

        OrderRequest request;
        request.side = *side;
        request.type = type;
        request.ticker = args[3];
        if (!parse_int(args[4], request.quantity)) {
            return print_error(make_error_code(ErrorCode::INVALID_QUANTITY));
        }
        if (type == OrderType::LIMIT) {
            int64_t price = 0;
            if (!parse_int(args[5], price)) {
                return print_error(make_error_code(ErrorCode::INVALID_PRICE));
            }
            request.price = price;
        }

        with_user(args[1], [&](const User& user) {
            request.user_id = user.id;
            auto order = exchange_.submit_order(request);
            if (order.has_error()) return print_error(order.error());
            print_order(order.value());
        });
    }

    void handle_order_lookup(const std::vector<std::string>& args, bool cancel) {
        auto order_id = Uuid::parse(args[2]);
        if (order_id.has_error()) return print_error(order_id.error());

        with_user(args[1], [&](const User& user) {
            if (cancel) {
                auto cancelled = exchange_.cancel_order(order_id.value(), user.id);
                if (cancelled.has_error()) return print_error(cancelled.error());
                print_order(cancelled.value());
            } else {
                auto found = exchange_.get_order(order_id.value(), user.id);
                if (found.has_error()) return print_error(found.error());
                print_report(found.value());
            }
        });
    }

    void handle_market_data(const std::vector<std::string>& args, bool book) {
        std::optional<size_t> count;
        if (args.size() == 3) {
            int64_t value = 0;
            if (!parse_int(args[2], value) || value <= 0) {
                return print_error(make_error_code(ErrorCode::INVALID_LIMIT));
            }
            count = static_cast<size_t>(value);
        }

        if (book) {
            auto snapshot = exchange_.get_book(args[1], count);
            if (snapshot.has_error()) return print_error(snapshot.error());
            for (const auto& level : snapshot.value().asks) {
                std::cout << "ask " << level.price << " " << level.quantity << "\n";
            }
            for (const auto& level : snapshot.value().bids) {
                std::cout << "bid " << level.price << " " << level.quantity << "\n";
            }
        } else {
            auto trades = exchange_.get_recent_trades(args[1], count);
            if (trades.has_error()) return print_error(trades.error());
            for (const auto& trade : trades.value()) {
                std::cout << "#" << trade.id << " " << trade.ticker << " " << trade.quantity
                          << "@" << trade.price << "\n";
            }
        }
    }
};

} // namespace

int run_shell(std::unique_ptr<Config> config, std::istream& in) {
    Exchange exchange(std::move(config));
    CommandShell shell(exchange);

    for (std::string line; std::getline(in, line);) {
        if (!shell.execute(line)) break;
    }

    LOG_INFO_SAFE("Session finished: {} orders accepted, {} rejected, {} trades",
                  exchange.matching_engine().orders_accepted(),
                  exchange.matching_engine().orders_rejected(),
                  exchange.matching_engine().trades_executed());
    return 0;
}

} // namespace bourse

int main(int argc, char* argv[]) {
    if (argc > 2) {
        std::cerr << "Usage: " << argv[0] << " [config_file]" << std::endl;
        return 1;
    }

    try {
        auto config = argc == 2 ? bourse::Config::load_from_file(argv[1]) : bourse::Config::defaults();
        return bourse::run_shell(std::move(config), std::cin);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << bourse::SecurityUtils::sanitize_log_input(e.what()) << std::endl;
        return 1;
    }
}
