//=============================================================================
// Result Unit Tests
//=============================================================================

#include <boost/ut.hpp>
#include <cavern/result.hpp>

#include <memory>
#include <string>

using namespace boost::ut;
using namespace cavern;

namespace {

struct Shape {
    virtual ~Shape() = default;
    virtual int sides() const = 0;
};

struct Square : Shape {
    int sides() const override { return 4; }
};

Result<int> parsePositive(int v) {
    if (v <= 0) return Err<int>("not positive: " + std::to_string(v));
    return Ok(v);
}

Result<void> validate(int v) {
    if (auto res = parsePositive(v); !res) {
        return Err<void>("validation failed", res);
    }
    return Ok();
}

} // namespace

suite result_tests = [] {
    "Ok carries a value"_test = [] {
        auto r = parsePositive(5);
        expect(r.has_value());
        expect(*r == 5_i);
        expect(error_msg(r).empty());
    };

    "Err carries a message"_test = [] {
        auto r = parsePositive(-2);
        expect(!r);
        expect(r.error().message() == std::string("not positive: -2"));
        expect(r.error().cause() == nullptr);
    };

    "wrapped errors chain their causes"_test = [] {
        auto r = validate(0);
        expect(!r.has_value());
        expect(r.error().message() == std::string("validation failed"));
        expect(r.error().cause() != nullptr);
        expect(error_msg(r) == std::string("validation failed: not positive: 0"));

        auto outer = Err<int>("startup", r);
        expect(error_msg(outer) == std::string("startup: validation failed: not positive: 0"));
    };

    "void success"_test = [] {
        auto r = validate(3);
        expect(r.has_value());
        expect(error_msg(r).empty());
    };

    "pointer results convert to a base"_test = [] {
        Result<std::shared_ptr<Shape>> r = Ok(std::make_shared<Square>());
        expect(r.has_value());
        expect((*r)->sides() == 4_i);

        Result<std::shared_ptr<Shape>> failed = Err<std::shared_ptr<Square>>("no square");
        expect(!failed);
        expect(error_msg(failed) == std::string("no square"));
    };
};
