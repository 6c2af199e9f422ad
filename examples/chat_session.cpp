// Interactive chat over one or more stdio tool providers.
//
// Usage: mcpchat_example_chat_session --server NAME "COMMAND [ARGS...]" [--server ...]
//
// Provider and model come from LLM_PROVIDER / LLM_MODEL; timeouts, round limit and
// log level from the MCPCHAT_* variables. Type "exit" or "quit" to leave.

#include <mcpchat.hpp>

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace
{

std::vector<std::string> split_words(const std::string& s)
{
    std::istringstream in(s);
    std::vector<std::string> words;
    std::string w;
    while (in >> w)
        words.push_back(w);
    return words;
}

} // namespace

int main(int argc, char** argv)
{
    using namespace mcpchat;

    std::vector<ServerSpec> specs;
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg != "--server" || i + 2 >= argc)
        {
            std::cerr << "usage: " << argv[0] << " --server NAME \"COMMAND [ARGS...]\" ..."
                      << std::endl;
            return 2;
        }
        ServerSpec spec;
        spec.name = argv[++i];
        auto words = split_words(argv[++i]);
        if (words.empty())
        {
            std::cerr << "empty command for server " << spec.name << std::endl;
            return 2;
        }
        spec.command = words.front();
        spec.args.assign(words.begin() + 1, words.end());
        specs.push_back(std::move(spec));
    }

    try
    {
        auto settings = Settings::from_env();
        log::set_level(log::level_from_string(settings.log_level));

        session::SessionManager session(session::SessionOptions::from_settings(settings));
        session.start(specs);

        auto service = completion::create_completion_service(settings.provider, settings.model);
        engine::ConversationEngine engine(engine::EngineOptions::from_settings(settings));

        std::cout << "Provider: " << settings.provider << " | Model: " << service->model()
                  << " | Tools: " << session.registry().size() << " | Type 'exit' to quit."
                  << std::endl;

        Conversation conversation;
        std::string line;
        while (std::cout << "> " << std::flush && std::getline(std::cin, line))
        {
            if (line == "exit" || line == "quit")
                break;
            if (line.empty())
                continue;

            engine::RunOptions run_options;
            run_options.add_system_prompt = conversation.empty();
            conversation.push_back(Message::user(line));
            try
            {
                engine.run(conversation, session.registry(), *service, run_options);
                std::cout << conversation.back().content << std::endl;
            }
            catch (const CompletionError& e)
            {
                std::cerr << "completion failed: " << e.what() << std::endl;
            }
            catch (const LoopLimitExceeded& e)
            {
                std::cerr << e.what() << std::endl;
            }
        }

        auto report = session.stop();
        for (const auto& name : report.forced)
            std::cerr << "server " << name << " had to be terminated" << std::endl;
    }
    catch (const SessionStartError& e)
    {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    catch (const ValidationError& e)
    {
        std::cerr << "configuration error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
