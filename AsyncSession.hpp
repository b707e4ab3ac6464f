// File: AsyncSession.hpp
// Description: Manages a single client's WebSocket session, handling
// all asynchronous I/O and routing its commands to the battle coordinator.
#pragma once

#include "PlayerChannel.hpp"
#include "BattleCoordinator.hpp"
#include "ConnectionRegistry.hpp"
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <memory>
#include <optional>
#include <queue>
#include <string>
#include <atomic>
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

class AsyncSession;
using OpenConnections = ConnectionRegistry<AsyncSession>;

// Owns one ws connection. All members below are touched on its strand only,
// except the atomics and the ids (fixed once set).
class AsyncSession : public PlayerChannel, public std::enable_shared_from_this<AsyncSession>
{
	// --- Networking Members ---
	websocket::stream<tcp::socket> ws_; // executor is this connection's strand
	beast::flat_buffer buffer_;
	std::string client_address_; // for logging
	std::queue<std::shared_ptr<const std::string>> write_queue_;
	bool is_writing_ = false;
	bool ended_ = false;

	std::shared_ptr<BattleCoordinator> coordinator_;
	std::shared_ptr<OpenConnections> connections_;

	const std::string connection_id_;
	std::string user_id_;
	std::atomic<bool> is_authenticated_{ false };
	std::atomic<bool> auth_pending_{ false };
	std::atomic<bool> is_open_{ false };

public:
	AsyncSession(
		tcp::socket socket,
		std::shared_ptr<BattleCoordinator> coordinator,
		std::shared_ptr<OpenConnections> connections
	);

	~AsyncSession() noexcept override;

	// Start the session's asynchronous operations
	void run();
	void send_shutdown_warning(int seconds);
	void disconnect();

	// --- PlayerChannel ---
	const std::string& connectionId() const override { return connection_id_; }
	const std::string& userId() const override { return user_id_; }
	bool isOpen() const override { return is_open_; }
	void send(std::string message) override;

private:
	void on_run();
	void do_read();
	void on_read(beast::error_code ec, std::size_t bytes_transferred);
	void do_async_write();
	void on_write(beast::error_code ec, std::size_t bytes_transferred);
	void on_session_end();

	/**
	 * @brief The main router for all incoming client messages.
	 * @param message The raw message from the client.
	 */
	void handle_message(const std::string& message);

	void handle_auth(const std::string& sid);
	void on_auth_finished(const std::optional<std::string>& userId);
	void handle_battle_action(const std::string& actionText);
	void handle_allocate_stats(const std::string& args);
};
