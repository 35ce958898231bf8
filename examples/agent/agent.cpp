#include "SNMP_Agent.h"

// Server side implementation of UDP client-server model
#include <arpa/inet.h>
#include <netinet/in.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <string>

#define DEFAULT_PORT 161

static time_t startedAt;
static std::string sysName = "example";

// TimeTicks are hundredths of a second
static uint32_t getUptime(){
    return (uint32_t)(difftime(time(nullptr), startedAt) * 100);
}

int main(int argc, char** argv) {
    int port = DEFAULT_PORT;
    if (argc > 1) {
        port = atoi(argv[1]);
        if (port <= 0 || port > 65535) {
            fprintf(stderr, "usage: %s [port]\n", argv[0]);
            return EXIT_FAILURE;
        }
    }

    startedAt = time(nullptr);

    SNMPAgent agent("public", "private");

    if (agent.addReadOnlyStaticStringHandler(RFC1213_OID_sysDescr, "SNMP Engine example agent") != SNMP_REGISTER_OK ||
        agent.addDynamicReadOnlyTimestampHandler(RFC1213_OID_sysUpTime, getUptime) != SNMP_REGISTER_OK ||
        agent.addReadWriteStringHandler(RFC1213_OID_sysName, &sysName, 255, true) != SNMP_REGISTER_OK) {
        fprintf(stderr, "failed to register objects\n");
        return EXIT_FAILURE;
    }

    int sockfd;
    uint8_t buffer[MAX_SNMP_PACKET_LENGTH];
    struct sockaddr_in servaddr, cliaddr;

    // Creating socket file descriptor
    if ((sockfd = socket(AF_INET, SOCK_DGRAM, 0)) < 0) {
        perror("socket creation failed");
        return EXIT_FAILURE;
    }

    memset(&servaddr, 0, sizeof(servaddr));
    memset(&cliaddr, 0, sizeof(cliaddr));

    servaddr.sin_family = AF_INET;
    servaddr.sin_addr.s_addr = INADDR_ANY;
    servaddr.sin_port = htons(port);

    if (bind(sockfd, (const struct sockaddr *) &servaddr, sizeof(servaddr)) < 0) {
        perror("bind failed");
        close(sockfd);
        return EXIT_FAILURE;
    }

    printf("listening on udp port %d\n", port);

    while (true) {
        socklen_t len = sizeof(cliaddr);
        ssize_t n = recvfrom(sockfd, buffer, sizeof(buffer), 0, (struct sockaddr *) &cliaddr, &len);
        if (n < 0) {
            perror("recvfrom failed");
            close(sockfd);
            return EXIT_FAILURE;
        }

        int responseLength = 0;
        SNMP_ERROR_RESPONSE response = agent.processDatagram(buffer, (int) n, &responseLength, sizeof(buffer));

        if (response <= 0) {
            fprintf(stderr, "dropped datagram from %s: %d\n", inet_ntoa(cliaddr.sin_addr), response);
            continue;
        }

        if (sendto(sockfd, buffer, responseLength, 0, (const struct sockaddr *) &cliaddr, len) < 0) {
            perror("sendto failed");
        }

        if (agent.setOccurred) {
            printf("sysName is now: %s\n", sysName.c_str());
            agent.resetSetOccurred();
        }
    }
}
