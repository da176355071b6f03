#include <json/json.h>
#include <memory>
#include <stdexcept>
#include <string>
#include "common.hh"
#include "rdap.hh"

using namespace forsale;

namespace {
Json::Value parse(const std::string &json) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
    Json::Value root;
    std::string errors;
    ASSERT(reader->parse(json.data(), json.data() + json.size(), &root, &errors));
    return root;
}
}  // namespace

int main() {
    auto registry = parse(R"({
        "version": "1.0",
        "services": [
            [["com", "NET"], ["https://rdap.verisign.com/com/v1/", "http://rdap.verisign.com/com/v1/"]],
            [["example.com."], ["https://rdap.example.com"]],
            [["org"], ["http://rdap.insecure.org/"]],
            [["uk", "co.uk"], ["https://rdap.nominet.uk/uk/"]]
        ]
    })");

    auto services = parse_bootstrap(registry);
    ASSERT(services.size() == 5);
    ASSERT(services[1].suffix == "net");
    ASSERT(services[1].base_url == "https://rdap.verisign.com/com/v1");
    ASSERT(services[2].suffix == "example.com");

    ASSERT(find_rdap_server(services, "shop.com") == "https://rdap.verisign.com/com/v1");
    ASSERT(find_rdap_server(services, "example.net") == "https://rdap.verisign.com/com/v1");
    ASSERT(find_rdap_server(services, "sub.example.com") == "https://rdap.example.com");
    ASSERT(find_rdap_server(services, "example.com") == "https://rdap.example.com");
    ASSERT(find_rdap_server(services, "myexample.com") == "https://rdap.verisign.com/com/v1");
    ASSERT(find_rdap_server(services, "shop.co.uk") == "https://rdap.nominet.uk/uk");
    ASSERT(!find_rdap_server(services, "example.org").has_value());
    ASSERT(!find_rdap_server(services, "example.dev").has_value());

    ASSERT_THROWS(parse_bootstrap(parse(R"({"services": {}})")), std::runtime_error, );
    ASSERT_THROWS(parse_bootstrap(parse(R"({"services": [["com"]]})")), std::runtime_error, );
    ASSERT_THROWS(parse_bootstrap(parse("[]")), std::runtime_error, );
    return EXIT_SUCCESS;
}
