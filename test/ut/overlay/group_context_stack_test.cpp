//=============================================================================
// GroupContextStack Tests
//=============================================================================

#include <boost/ut.hpp>
#include <inkwell/overlay/group-context-stack.h>

#include <string>
#include <vector>

using namespace boost::ut;
using namespace inkwell::overlay;

suite context_stack_tests = [] {
    "empty stack peeks and pops empty names"_test = [] {
        GroupContextStack stack;
        expect(stack.empty());
        expect(stack.peek() == "");
        expect(stack.pop() == "");
    };

    "push moves an existing name to the front"_test = [] {
        GroupContextStack stack;
        stack.push("a");
        stack.push("b");
        stack.push("c");
        stack.push("a");

        expect(stack.size() == 3_u);
        expect(stack.names() == std::vector<std::string>{"a", "c", "b"});
        expect(stack.peek() == "a");
    };

    "peek does not consume"_test = [] {
        GroupContextStack stack;
        stack.push("hud");
        expect(stack.peek() == "hud");
        expect(stack.peek() == "hud");
        expect(stack.size() == 1_u);
    };

    "pop returns names most recent first"_test = [] {
        GroupContextStack stack;
        stack.push("a");
        stack.push("b");
        expect(stack.pop() == "b");
        expect(stack.pop() == "a");
        expect(stack.pop() == "");
    };

    "clear empties the stack"_test = [] {
        GroupContextStack stack;
        stack.push("a");
        stack.clear();
        expect(stack.empty());
    };
};
