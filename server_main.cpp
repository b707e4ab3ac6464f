// ==========================================
// File: server_main.cpp
// Description: Entry point for the arena server.
// Handles networking, DB connections, the admin grant, and graceful shutdown.
// ==========================================

#include "AsyncSession.hpp"
#include "BattleCoordinator.hpp"
#include "CombatRng.hpp"
#include "DatabaseManager.hpp"
#include "LootTables.hpp"
#include "PgPlayerStore.hpp"
#include "ServerConfig.hpp"
#include "ThreadPool.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/steady_timer.hpp>
#include <algorithm>
#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <sodium.h>
namespace net = boost::asio;
using tcp = net::ip::tcp;

// ==========================================
// Listener Class
// ==========================================
class listener : public std::enable_shared_from_this<listener>
{
	net::io_context& ioc_;
	tcp::acceptor acceptor_;
	std::shared_ptr<BattleCoordinator> coordinator_;
	std::shared_ptr<OpenConnections> connections_;

public:
	listener(net::io_context& ioc, tcp::endpoint endpoint,
		std::shared_ptr<BattleCoordinator> coordinator, std::shared_ptr<OpenConnections> connections)
		: ioc_(ioc), acceptor_(ioc), coordinator_(std::move(coordinator)), connections_(std::move(connections))
	{
		boost::system::error_code ec;

		acceptor_.open(endpoint.protocol(), ec);
		if (ec) throw std::runtime_error("Listener open: " + ec.message());

		acceptor_.set_option(net::socket_base::reuse_address(true), ec);
		if (ec) throw std::runtime_error("Listener set_option: " + ec.message());

		acceptor_.bind(endpoint, ec);
		if (ec) throw std::runtime_error("Listener bind: " + ec.message());

		acceptor_.listen(net::socket_base::max_listen_connections, ec);
		if (ec) throw std::runtime_error("Listener listen: " + ec.message());
	}

	void run() { do_accept(); }

	void stop()
	{
		net::dispatch(acceptor_.get_executor(), [self = shared_from_this()]() {
			boost::system::error_code ec;
			self->acceptor_.close(ec);
			});
	}

private:
	void do_accept()
	{
		acceptor_.async_accept(
			net::make_strand(ioc_),
			[self = shared_from_this()](boost::system::error_code ec, tcp::socket socket)
			{
				if (ec == net::error::operation_aborted)
					return; // acceptor closed for shutdown

				if (!ec)
				{
					std::make_shared<AsyncSession>(
						std::move(socket),
						self->coordinator_,
						self->connections_
					)->run();
				}
				else
				{
					std::cerr << "[ACCEPT ERROR] " << ec.message() << std::endl;
				}

				self->do_accept();
			});
	}
};

// Gives the configured admin the supreme character if they lack one.
// Failure here is logged; the server still starts.
void grant_admin_supreme(PlayerStore& store, const std::string& adminUserId)
{
	if (adminUserId.empty())
		return;
	try {
		ensure_supreme_character(store, adminUserId);
	}
	catch (const std::exception& e) {
		std::cerr << "[ADMIN] Could not grant the supreme character to " << adminUserId << ": " << e.what() << std::endl;
	}
}

// ==========================================
// Main Entry Point
// ==========================================
int main(int argc, char* argv[])
{
	const std::string config_path = argc > 1 ? argv[1] : "server_config.json";

	net::io_context ioc;

	try {
		ServerConfig config = load_server_config(config_path);
		if (config.databaseUrl.empty())
			throw std::runtime_error("No database configured. Set DATABASE_URL or database_url.");

		// --- Crypto ---
		if (sodium_init() < 0)
			throw std::runtime_error("Libsodium failed to initialize!");
		std::cout << "Libsodium initialized successfully.\n";

		// --- Database Initialization ---
		auto db_manager = std::make_shared<DatabaseManager>(config.databaseUrl);
		auto store = std::make_shared<PgPlayerStore>(db_manager);
		auto db_pool = std::make_shared<ThreadPool>(static_cast<size_t>(std::max(1, config.dbThreads)));

		grant_admin_supreme(*store, config.adminUserId);

		// --- Game Systems ---
		BattleServices services{ store, db_pool, std::make_shared<MersenneRng>(), config.rules };
		auto coordinator = std::make_shared<BattleCoordinator>(ioc, services,
			std::make_shared<SessionRegistry>(), std::make_shared<MatchQueue>());
		auto connections = std::make_shared<OpenConnections>();

		// --- Listener ---
		const auto address = net::ip::make_address(config.address);
		auto listener_ptr = std::make_shared<listener>(
			ioc, tcp::endpoint{ address, config.port }, coordinator, connections);
		listener_ptr->run();

		std::cout << "Arena server is listening on " << config.address << ":" << config.port << "...\n";
		std::cout << "Type 'exit' or 'shutdown' to stop the server.\n";

		// Keeps run() alive until shutdown even with no clients
		auto work = net::make_work_guard(ioc);

		// --- Console Command Thread ---
		std::thread console_thread([&ioc, &work, listener_ptr, connections]() {
			std::string command;
			while (std::getline(std::cin, command))
			{
				if (command == "exit" || command == "shutdown")
				{
					std::cout << "\n--- SHUTDOWN INITIATED ---" << std::endl;
					listener_ptr->stop();

					const int grace_period = 10;
					auto clients = connections->snapshot();
					std::cout << "Broadcasting shutdown warning to " << clients.size() << " clients.\n";
					for (auto& session : clients)
						session->send_shutdown_warning(grace_period);

					// Graceful shutdown timer
					auto shutdown_timer = std::make_shared<net::steady_timer>(ioc);
					shutdown_timer->expires_after(std::chrono::seconds(grace_period));

					shutdown_timer->async_wait([&ioc, &work, shutdown_timer, connections](const boost::system::error_code& ec)
						{
							if (ec && ec != net::error::operation_aborted)
							{
								std::cerr << "[SHUTDOWN TIMER ERROR] " << ec.message() << std::endl;
							}

							std::cout << "--- Final disconnect phase ---" << std::endl;
							auto remaining = connections->snapshot();
							for (auto& s : remaining)
								s->disconnect();

							std::cout << "Finalized disconnects for " << remaining.size() << " players.\n";
							work.reset();
							ioc.stop();
						});

					break;
				}
			}
			});

		// --- Thread Pool ---
		unsigned const threads = std::max<unsigned>(1, std::thread::hardware_concurrency());
		std::vector<std::thread> thread_pool;
		thread_pool.reserve(threads - 1);
		for (unsigned i = 1; i < threads; ++i)
			thread_pool.emplace_back([&ioc] { ioc.run(); });

		ioc.run(); // main thread

		for (auto& t : thread_pool) t.join();
		console_thread.join();
	}
	catch (const std::exception& e) {
		std::cerr << "FATAL ERROR: " << e.what() << std::endl;
		return 1;
	}

	std::cout << "Server shut down cleanly.\n";
	return 0;
}
