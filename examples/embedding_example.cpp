// Embedding example: host builtins, typed inputs and outputs, and a queued callback.
#include <iostream>
#include <string>
#include "ebs/ebs.hpp"

using namespace ebs;

int main(){
    const char* src = R"EBS(
        Order typeof record{id: int, customer: record{name: string, city: string}, qty: int};

        varset input in {
            var order: Order;
            var discount: double = 0.0;
        }
        varset output out {
            var summary: string;
            var total: double;
        }

        function price(qty: int) return double {
            return qty * 2.5;
        }

        function on_refresh(reason: string) {
            call host.log("refresh: " + reason);
            output.total = price(input.order.qty) * (1 - input.discount);
        }

        output.total = price(input.order.qty) * (1 - input.discount);
        output.summary = input.order.customer.name + " (" + input.order.customer.city + ") x" + input.order.qty;
        call host.log(output.summary);
    )EBS";

    BuiltinRegistry::Builder builder;
    register_standard_builtins(builder);
    builder.add("host.log", [](std::vector<Value>& args, ExecContext& ctx) -> Value {
        ctx.out() << "[host] " << display_string(args[0]) << "\n";
        return Value();
    }, 1, 1);
    auto builtins = builder.build();

    ProgramPtr program;
    try {
        program = parse(src, "embedding_example");
    } catch(const ScriptError& e) {
        std::cerr << "compile failed: " << e.what() << "\n";
        return 1;
    }

    InterpreterOptions options;
    options.name = "shop";
    Interpreter interp(builtins, options);

    // The literal is converted field by field: "7" becomes the int 7.
    ObjectValue customer;
    customer.set("name", Value("Ann"));
    customer.set("city", Value("Oslo"));
    ObjectValue order;
    order.set("id", Value(1));
    order.set("customer", Value(customer));
    order.set("qty", Value("7"));

    try {
        interp.run(program, {{"shop.input.order", Value(order)}, {"shop.input.discount", Value(0.1)}});
        std::cout << "summary = " << display_string(interp.get_var("shop.output.summary")) << "\n";
        std::cout << "total = " << display_string(interp.get_var("shop.output.total")) << "\n";

        auto done = interp.submit_callback("on_refresh", {Value("timer")});
        done.get();
        std::cout << "total after refresh = " << display_string(interp.get_var("shop.output.total")) << "\n";

        for(const auto& path : interp.list_vars()) std::cout << "  " << path << "\n";
    } catch(const ScriptError& e) {
        std::cerr << e.category() << ": " << e.what() << "\n";
        return 2;
    }
    return 0;
}
