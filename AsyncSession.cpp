#include "AsyncSession.hpp"
#include "CombatRng.hpp"
#include <iostream>

/**
 * @brief Constructs the session, moving the socket into the WebSocket stream.
 */
AsyncSession::AsyncSession(
	tcp::socket socket,
	std::shared_ptr<BattleCoordinator> coordinator,
	std::shared_ptr<OpenConnections> connections
)
	: ws_(std::move(socket))
	, coordinator_(std::move(coordinator))
	, connections_(std::move(connections))
	, connection_id_("conn_" + random_hex_id(8))
{
	beast::error_code ec;
	auto endpoint = ws_.next_layer().remote_endpoint(ec);
	client_address_ = ec ? std::string("unknown") : endpoint.address().to_string();
	std::cout << "--- New Client Connected from: " << client_address_ << " ---" << std::endl;
}

AsyncSession::~AsyncSession() noexcept
{
	connections_->remove(connection_id_);
}

/**
 * @brief Starts the session by posting the on_run handler to the strand.
 */
void AsyncSession::run()
{
	net::dispatch(ws_.get_executor(),
		[self = shared_from_this()]()
		{
			self->on_run();
		});
}

/**
 * @brief Performs the WebSocket handshake.
 */
void AsyncSession::on_run()
{
	ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));

	ws_.async_accept(
		net::bind_executor(ws_.get_executor(),
			[self = shared_from_this()](beast::error_code ec)
			{
				if (ec)
				{
					std::cerr << "[" << self->client_address_ << "] Handshake Error: " << ec.message() << "\n";
					return self->on_session_end();
				}

				std::cout << "[" << self->client_address_ << "] Handshake successful. Session started.\n";
				self->is_open_ = true;
				self->connections_->add(self->connection_id_, self);

				self->send("SERVER:WELCOME");
				self->do_read();
			}));
}

/**
 * @brief Posts an asynchronous read operation.
 */
void AsyncSession::do_read()
{
	ws_.async_read(buffer_,
		net::bind_executor(ws_.get_executor(),
			[self = shared_from_this()](beast::error_code ec, std::size_t bytes)
			{
				self->on_read(ec, bytes);
			}));
}

/**
 * @brief Callback for when a read completes.
 */
void AsyncSession::on_read(beast::error_code ec, std::size_t bytes_transferred)
{
	boost::ignore_unused(bytes_transferred);

	if (ec == websocket::error::closed || ec == net::error::eof || ec == net::error::operation_aborted)
		return on_session_end();

	if (ec)
	{
		std::cerr << "[" << client_address_ << "] Read Error: " << ec.message() << "\n";
		return on_session_end();
	}

	std::string message = beast::buffers_to_string(buffer_.data());
	buffer_.consume(buffer_.size());

	std::cout << "[" << client_address_ << "] Received: " << message << "\n";

	try
	{
		handle_message(message);
	}
	catch (const std::exception& e)
	{
		std::cerr << "[" << client_address_ << "] Error handling '" << message << "': " << e.what() << "\n";
		send("SERVER:ERROR:An internal server error occurred.");
	}

	do_read();
}

// --- ASYNC WRITE QUEUE ---

/**
 * @brief Queues a message and starts the write loop if it is idle.
 * Safe from any thread.
 */
void AsyncSession::send(std::string message)
{
	auto shared_msg = std::make_shared<const std::string>(std::move(message));

	net::dispatch(ws_.get_executor(),
		[self = shared_from_this(), shared_msg]()
		{
			if (self->ended_)
				return;
			self->write_queue_.push(shared_msg);
			if (!self->is_writing_)
			{
				self->do_async_write();
			}
		});
}

/**
 * @brief The actual async write operation. Always runs on the strand.
 */
void AsyncSession::do_async_write()
{
	is_writing_ = true;
	auto msg = write_queue_.front();

	ws_.async_write(net::buffer(*msg),
		net::bind_executor(ws_.get_executor(),
			[self = shared_from_this(), msg](beast::error_code ec, std::size_t bytes)
			{
				self->on_write(ec, bytes);
			}));
}

void AsyncSession::on_write(beast::error_code ec, std::size_t bytes_transferred)
{
	boost::ignore_unused(bytes_transferred);

	if (ec == websocket::error::closed || ec == net::error::eof || ec == net::error::operation_aborted)
		return on_session_end();

	if (ec)
	{
		std::cerr << "[" << client_address_ << "] Write Error: " << ec.message() << "\n";
		return on_session_end();
	}

	write_queue_.pop();

	if (!write_queue_.empty())
	{
		do_async_write();
	}
	else
	{
		is_writing_ = false;
	}
}
// --- END ASYNC WRITE QUEUE ---

/**
 * @brief Cleans up the session on disconnect or error. Runs once.
 */
void AsyncSession::on_session_end()
{
	if (ended_)
		return;
	ended_ = true;
	is_open_ = false;

	// Leaves the match queue and forfeits or discards any live battle
	coordinator_->onDisconnect(connection_id_, is_authenticated_ ? user_id_ : std::string());
	connections_->remove(connection_id_);

	std::cout << "[" << client_address_ << "] Client disconnected.\n";
}

void AsyncSession::send_shutdown_warning(int seconds)
{
	send("SERVER:SHUTDOWN:" + std::to_string(seconds));
}

/**
 * @brief Posts a disconnect operation to the session's strand.
 */
void AsyncSession::disconnect()
{
	net::dispatch(ws_.get_executor(),
		[self = shared_from_this()]()
		{
			beast::error_code ec;
			self->ws_.close(websocket::close_code::service_restart, ec);
			self->on_session_end();
		});
}
