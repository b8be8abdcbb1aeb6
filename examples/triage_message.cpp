/*

triage_message.cpp
------------------

Triages one provider message read from a JSON file and prints the output object.
The classification response is replayed from a second JSON file; without it the gateway fails and the fallback output
is printed.

Usage: triage_message <message.json> [candidate.json]


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the MIT license, see the accompanying file LICENSE or
copy at https://opensource.org/licenses/MIT.

*/


#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <triagexx/triagexx.hpp>


using std::cout;
using std::cerr;
using std::string;
using triagexx::error;
using triagexx::error_code;
using triagexx::pipeline;
using triagexx::replay_gateway;


namespace
{

std::optional<string> read_file(const char* path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::nullopt;
    std::ostringstream text;
    text << in.rdbuf();
    return text.str();
}

void print_error(const error& err)
{
    cerr << "Error: " << triagexx::error_code_token(err.code()) << " - " << err.message() << "\n";
    if (!err.detail().empty())
        cerr << "Detail: " << err.detail() << "\n";
}

} // namespace


int main(int argc, char* argv[])
{
    if (argc < 2 || argc > 3)
    {
        cerr << "usage: " << argv[0] << " <message.json> [candidate.json]\n";
        return EXIT_FAILURE;
    }

    if (const char* lvl = std::getenv("TRIAGEXX_LOG_LEVEL"))
    {
        triagexx::log::level level;
        if (triagexx::log::level_from_string(lvl, level))
            triagexx::log::logger::instance().set_level(level);
    }

    auto config = triagexx::load_config();
    if (!config)
    {
        print_error(config.error());
        return EXIT_FAILURE;
    }

    auto message_text = read_file(argv[1]);
    if (!message_text)
    {
        cerr << "cannot read " << argv[1] << "\n";
        return EXIT_FAILURE;
    }
    auto message = triagexx::parse_raw_message_json(*message_text);
    if (!message)
    {
        print_error(message.error());
        return EXIT_FAILURE;
    }

    std::unique_ptr<replay_gateway> gateway;
    if (argc == 3)
    {
        auto candidate_text = read_file(argv[2]);
        if (!candidate_text)
        {
            cerr << "cannot read " << argv[2] << "\n";
            return EXIT_FAILURE;
        }
        // A candidate that is not valid JSON is replayed as a malformed gateway response.
        auto candidate = triagexx::parse_json(*candidate_text);
        if (candidate)
            gateway = std::make_unique<replay_gateway>(std::move(*candidate));
        else
            gateway = std::make_unique<replay_gateway>(error(error_code::gateway_invalid_response,
                "Classification is not valid JSON.", candidate.error().detail()));
    }
    else
        gateway = std::make_unique<replay_gateway>(error(error_code::gateway_error, "No classification service configured."));

    pipeline triage(*config, *gateway);
    const triagexx::triage_output out = triage.run_blocking(*message);
    cout << triagexx::write_json(triagexx::to_response_json(out)) << "\n";
    return EXIT_SUCCESS;
}
