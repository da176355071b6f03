#include <string>
#include "common.hh"
#include "domain.hh"

using namespace forsale;

int main() {
    ASSERT(normalize_domain("example.com") == "example.com");
    ASSERT(normalize_domain("EXAMPLE.com.") == "example.com");
    ASSERT(normalize_domain("sub.xn--bcher-kva.example") == "sub.xn--bcher-kva.example");
    ASSERT(normalize_domain("123.example.com") == "123.example.com");

    ASSERT(!normalize_domain("example.com..").has_value());
    ASSERT(!normalize_domain("com").has_value());
    ASSERT(!normalize_domain("example.com/path").has_value());
    ASSERT(!normalize_domain("exam_ple.com").has_value());

    auto label63 = std::string(63, 'a');
    ASSERT(normalize_domain(label63 + ".com").has_value());
    ASSERT(!normalize_domain(label63 + "a.com").has_value());

    // `_for-sale.` plus the domain must fit in 253 octets without the root dot.
    auto name = label63 + "." + label63 + "." + label63 + "." + std::string(51, 'b');
    ASSERT(name.length() == 243);
    ASSERT(normalize_domain(name).has_value());
    ASSERT(!normalize_domain(name + "b").has_value());
    return EXIT_SUCCESS;
}
