/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-ordered LifecycleManager.
 *
 * initialize() builds a graph of the registered modules, sorts it topologically and
 * runs each startup callback in order. finalize() runs the shutdown callbacks in
 * reverse order, each bounded by its module's timeout using thread+flag+poll+detach
 * (not std::async, whose destructor blocks even after wait_for returns timeout).
 ******************************************************************************/
#include "bmc_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <algorithm>
#include <chrono>
#include <fmt/ranges.h> // For fmt::join on vectors
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace
{
/**
 * @brief Validates a module name: non-empty, within MAX_MODULE_NAME_LEN.
 * @throws std::invalid_argument if `name` is empty.
 * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
 */
void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > bmapcopy::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(bmapcopy::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

/**
 * @brief Runs `func` on a thread with a real deadline; detaches the thread on timeout.
 */
ShutdownOutcome timedShutdown(const std::function<void()> &func,
                              std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    // Shared with a thread that may outlive this call on timeout.
    struct SharedState
    {
        std::function<void()> func;
        std::atomic<bool> completed{false};
        std::string error;
    };
    auto state = std::make_shared<SharedState>();
    state->func = func;

    std::thread thread(
        [state]()
        {
            try
            {
                state->func();
            }
            catch (const std::exception &e)
            {
                state->error = e.what();
                if (state->error.empty())
                    state->error = "exception without message";
            }
            state->completed.store(true, std::memory_order_release);
        });

    if (timeout.count() == 0)
    {
        thread.join();
    }
    else
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!state->completed.load(std::memory_order_acquire))
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                thread.detach();
                return {false, true, {}};
            }
            constexpr std::chrono::milliseconds kPollInterval(10);
            std::this_thread::sleep_for(kPollInterval);
        }
        thread.join();
    }

    if (!state->error.empty())
    {
        return {false, false, state->error};
    }
    return {true, false, {}};
}

} // namespace

namespace bmapcopy::utils
{

class ModuleDefImpl
{
  public:
    std::string name;
    std::vector<std::string> dependencies;
    LifecycleCallback startup = nullptr;
    LifecycleCallback shutdown = nullptr;
    std::chrono::milliseconds shutdown_timeout{0};
};

// ============================================================================
// ModuleDef
// ============================================================================

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (dependency_name.empty())
    {
        return;
    }
    validate_module_name(dependency_name, "dependency name");
    pImpl->dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    pImpl->startup = startup_func;
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    pImpl->shutdown = shutdown_func;
    pImpl->shutdown_timeout = timeout;
}

std::string_view ModuleDef::name() const noexcept
{
    return pImpl ? std::string_view(pImpl->name) : std::string_view{};
}

// ============================================================================
// LifecycleManagerImpl
// ============================================================================

enum class ModuleStatus
{
    Registered,
    Started,
    Failed,
    Shutdown,
    FailedShutdown,
    ShutdownTimeout
};

struct InternalGraphNode
{
    std::string name;
    std::vector<std::string> dependencies;
    std::vector<InternalGraphNode *> dependents;
    LifecycleCallback startup = nullptr;
    LifecycleCallback shutdown = nullptr;
    std::chrono::milliseconds shutdown_timeout{0};
    ModuleStatus status = ModuleStatus::Registered;
};

class LifecycleManagerImpl
{
  public:
    void registerModule(std::unique_ptr<ModuleDefImpl> impl);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);
    bool isModuleStarted(std::string_view name);

    std::atomic<bool> m_is_initialized{false};
    std::atomic<bool> m_is_finalized{false};

  private:
    void buildGraph();
    static std::vector<InternalGraphNode *>
    topologicalSort(const std::vector<InternalGraphNode *> &nodes);
    [[noreturn]] void printStatusAndAbort(const std::string &msg, const std::string &mod = {});

    std::mutex m_mutex;
    std::map<std::string, InternalGraphNode> m_module_graph;
    std::vector<InternalGraphNode *> m_startup_order;
};

void LifecycleManagerImpl::registerModule(std::unique_ptr<ModuleDefImpl> impl)
{
    if (!impl)
    {
        return;
    }
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        BMC_PANIC("[BMC_LifeCycle] register_module('{}') called after initialize().",
                  impl->name);
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_module_graph.contains(impl->name))
    {
        printStatusAndAbort("Duplicate module registration", impl->name);
    }
    InternalGraphNode node;
    node.name = impl->name;
    node.dependencies = std::move(impl->dependencies);
    node.startup = impl->startup;
    node.shutdown = impl->shutdown;
    node.shutdown_timeout = impl->shutdown_timeout;
    m_module_graph.emplace(node.name, std::move(node));
}

void LifecycleManagerImpl::buildGraph()
{
    for (auto &[name, node] : m_module_graph)
    {
        for (const auto &dep_name : node.dependencies)
        {
            auto it = m_module_graph.find(dep_name);
            if (it == m_module_graph.end())
            {
                throw std::runtime_error(fmt::format(
                    "Module '{}' depends on unregistered module '{}'", name, dep_name));
            }
            it->second.dependents.push_back(&node);
        }
    }
}

std::vector<InternalGraphNode *>
LifecycleManagerImpl::topologicalSort(const std::vector<InternalGraphNode *> &nodes)
{
    std::vector<InternalGraphNode *> sorted_order;
    sorted_order.reserve(nodes.size());
    std::vector<InternalGraphNode *> zero_degree_queue;
    std::map<InternalGraphNode *, size_t> in_degrees;
    for (auto *node : nodes)
    {
        in_degrees[node] = 0;
    }
    for (auto *node : nodes)
    {
        for (auto *dep : node->dependents)
        {
            if (in_degrees.contains(dep))
            {
                in_degrees[dep]++;
            }
        }
    }
    for (auto *node : nodes)
    {
        if (in_degrees[node] == 0)
        {
            zero_degree_queue.push_back(node);
        }
    }
    size_t head = 0;
    while (head < zero_degree_queue.size())
    {
        InternalGraphNode *current = zero_degree_queue[head++];
        sorted_order.push_back(current);
        for (InternalGraphNode *dependent : current->dependents)
        {
            if (in_degrees.contains(dependent) && --in_degrees[dependent] == 0)
            {
                zero_degree_queue.push_back(dependent);
            }
        }
    }
    if (sorted_order.size() != nodes.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[cycle_node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(cycle_node->name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted_order;
}

void LifecycleManagerImpl::printStatusAndAbort(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n\n[BMC_LifeCycle] FATAL: {}. Aborting.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[BMC_LifeCycle] Module: '{}'\n", mod);
    }
    std::fflush(stderr);
    bmapcopy::debug::print_stack_trace();
    std::abort();
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string debug_info =
        fmt::format("[BMC_LifeCycle] [{}]:PID[{}]\n"
                    "     **** initialize() triggered from {} ({}:{})\n",
                    bmapcopy::platform::get_executable_name(), bmapcopy::platform::get_pid(),
                    loc.function_name(), bmapcopy::format_tools::filename_only(loc.file_name()),
                    loc.line());
    try
    {
        buildGraph();
        std::vector<InternalGraphNode *> nodes;
        for (auto &entry : m_module_graph)
        {
            nodes.push_back(&entry.second);
        }
        m_startup_order = topologicalSort(nodes);
    }
    catch (const std::runtime_error &e)
    {
        printStatusAndAbort(e.what());
    }

    for (auto *mod : m_startup_order)
    {
        debug_info += fmt::format("     -> Starting module: '{}'...", mod->name);
        try
        {
            if (mod->startup)
            {
                mod->startup(nullptr);
            }
            mod->status = ModuleStatus::Started;
            debug_info += "done.\n";
        }
        catch (const std::exception &e)
        {
            mod->status = ModuleStatus::Failed;
            BMC_DEBUG("{}", debug_info);
            printStatusAndAbort("Exception during startup: " + std::string(e.what()), mod->name);
        }
    }
    debug_info += "     -> Application initialization complete.\n";
    BMC_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_mutex);

    std::string debug_info =
        fmt::format("[BMC_LifeCycle] [{}]:PID[{}]\n"
                    "     **** finalize() called from {} ({}:{})\n",
                    bmapcopy::platform::get_executable_name(), bmapcopy::platform::get_pid(),
                    loc.function_name(), bmapcopy::format_tools::filename_only(loc.file_name()),
                    loc.line());

    for (auto it = m_startup_order.rbegin(); it != m_startup_order.rend(); ++it)
    {
        InternalGraphNode &mod = **it;
        if (mod.status != ModuleStatus::Started)
        {
            continue;
        }
        debug_info += fmt::format("     <- Shutting down module: '{}'...", mod.name);
        std::function<void()> func;
        if (mod.shutdown)
        {
            func = [cb = mod.shutdown]() { cb(nullptr); };
        }
        auto outcome = timedShutdown(func, mod.shutdown_timeout);
        if (outcome.success)
        {
            mod.status = ModuleStatus::Shutdown;
            debug_info += "done.\n";
        }
        else if (outcome.timed_out)
        {
            mod.status = ModuleStatus::ShutdownTimeout;
            debug_info +=
                fmt::format("TIMEOUT ({}ms)! Thread detached.\n", mod.shutdown_timeout.count());
        }
        else
        {
            mod.status = ModuleStatus::FailedShutdown;
            debug_info += fmt::format("\n     **** ERROR: module '{}' threw on shutdown: {}\n",
                                      mod.name, outcome.exception_msg);
        }
    }
    debug_info += "     <- Application finalization complete.\n";
    BMC_DEBUG("{}", debug_info);
}

bool LifecycleManagerImpl::isModuleStarted(std::string_view name)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_module_graph.find(std::string(name));
    return it != m_module_graph.end() && it->second.status == ModuleStatus::Started;
}

// ============================================================================
// LifecycleManager
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    pImpl->registerModule(std::move(module_def.pImpl));
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->m_is_initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized()
{
    return pImpl->m_is_finalized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_module_started(std::string_view name)
{
    return pImpl->isModuleStarted(name);
}

} // namespace bmapcopy::utils
