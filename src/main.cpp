#include "errchain/chain/chain_exceptions.hpp"
#include "errchain/chain/error_chain.hpp"
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

struct DemoArgs
{
    std::vector<std::string> words;
    std::optional<std::string> cause;
};

DemoArgs parse_args(int argc, char** argv)
{
    DemoArgs args;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg{argv[i]};
        if (arg == "--cause")
        {
            if (i + 1 >= argc)
            {
                throw std::invalid_argument("--cause requires a value");
            }
            args.cause = argv[++i];
        }
        else
        {
            args.words.push_back(arg);
        }
    }
    if (args.cause && args.words.size() < 2)
    {
        throw std::invalid_argument("--cause needs a root and at least one more word");
    }
    return args;
}

// First word is the root, every further word one derivation.
// The cause, if given, is attached to the last derivation.
errchain::ErrorChain build_chain(const DemoArgs& args)
{
    auto chain = errchain::ErrorChain::make(args.words.front());
    for (std::size_t i = 1; i < args.words.size(); ++i)
    {
        const bool last = (i + 1 == args.words.size());
        if (last && args.cause)
        {
            chain = chain.wrap_cause(args.words[i], errchain::ErrorChain::make(*args.cause));
        }
        else
        {
            chain = chain.wrap(args.words[i]);
        }
    }
    return chain;
}

} // namespace

int main(int argc, char** argv)
{
    std::optional<errchain::ErrorChain> root;
    try
    {
        std::cout << "\n\n====== errchain ======\n" << std::flush;

        const DemoArgs args = parse_args(argc, argv);
        if (!args.words.empty())
        {
            const errchain::ErrorChain chain = build_chain(args);
            root = chain;
            while (root->unwrap())
            {
                root = *root->unwrap();
            }
            chain.raise();
        }

        std::cout << "\n\n====== normal exit ======\n" << std::flush;
    }
    catch (const errchain::ErrorChainException& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        if (root && e.chain().is(*root))
        {
            std::cerr << "(derives from: " << *root << ")\n" << std::flush;
        }
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    catch (const std::exception& e)
    {
        std::cerr << "\n\nError:\n" << e.what() << "\n" << std::flush;
        std::cout << "\n\n====== abnormal exit ======\n" << std::flush;
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
