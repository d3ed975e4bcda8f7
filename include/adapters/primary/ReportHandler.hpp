#pragma once

#include "ICommandHandler.hpp"
#include "CommandSupport.hpp"
#include "JsonMapper.hpp"
#include "ports/input/IReportService.hpp"
#include "settings/AppSettings.hpp"
#include <memory>
#include <iostream>

namespace bookkeeping::adapters::primary
{

    /**
     * @brief report — итоги по балансам, журналу и кассе
     */
    class ReportHandler : public ICommandHandler
    {
    public:
        ReportHandler(
            std::shared_ptr<ports::input::IReportService> reportService,
            std::shared_ptr<settings::AppSettings> settings) : reportService_(std::move(reportService)), settings_(std::move(settings))
        {
            std::cout << "[ReportHandler] Created" << std::endl;
        }

        void handle(const CommandRequest &, CommandResponse &res) override
        {
            execute("ReportHandler", res, [&]
                    {
                auto summary = reportService_->summary();

                auto response = json::toJson(summary);
                response["grand_total_formatted"] = summary.balances.grandTotal.format(settings_->getCurrencySymbol());
                return response; });
        }

    private:
        std::shared_ptr<ports::input::IReportService> reportService_;
        std::shared_ptr<settings::AppSettings> settings_;
    };

} // namespace bookkeeping::adapters::primary
