/**
 * @file challenge_proof_example.cpp
 * @brief Builds and checks the proof an http-01 challenge is answered with
 *
 * Usage: challenge_proof_example [account-key.pem] [token]
 *
 * Without a key file a fresh 2048-bit RSA key is generated.
 */

#include "acmeflow/crypto.hpp"
#include "acmeflow/jwk.hpp"
#include "acmeflow/jws.hpp"
#include "acmeflow/resources.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

using namespace acmeflow;

static AccountKeyPair loadOrGenerateKey(int argc, char* argv[]) {
    if (argc < 2) {
        std::cout << "1. Generating RSA account key...\n";
        return AccountKeyPair::generateRsa();
    }

    std::cout << "1. Loading account key from " << argv[1] << "...\n";
    std::ifstream file(argv[1]);
    if (!file) {
        throwIoError(std::string("open ") + argv[1]);
    }
    std::stringstream pem;
    pem << file.rdbuf();
    return AccountKeyPair::fromPem(pem.str());
}

int main(int argc, char* argv[]) {
    std::cout << "ACME http-01 Challenge Proof Example\n";

    try {
        AccountKeyPair key = loadOrGenerateKey(argc, argv);
        std::string token = argc > 2 ? argv[2] : "IlirfxKKXAsHtmzK29Pj8A";

        if (!isValidToken(token)) {
            std::cerr << "Token contains characters outside [A-Za-z0-9_-]\n";
            return 1;
        }

        std::string jwk_json = jwk::createJWKFromKeyPair(key);
        std::cout << "   JWK: " << jwk_json << "\n";
        std::cout << "   Thumbprint: " << jwk::calculateJWKThumbprint(jwk_json) << "\n\n";

        std::cout << "2. Signing token " << token << "...\n";
        Rs256Algorithm rs256(key);
        auto proof = ChallengeProof::sign(token, rs256, jwk_json);
        std::string compact = proof.to_compact();
        std::cout << "   Serve at: /.well-known/acme-challenge/" << token << "\n";
        std::cout << "   Proof: " << compact << "\n\n";

        std::cout << "3. Verifying as the CA would...\n";
        auto parsed = ChallengeProof::from_compact(compact);
        bool valid = parsed.verify_signature() && parsed.get_token() == token;
        std::cout << "   " << (valid ? "Proof is valid" : "Proof is NOT valid") << "\n";
        return valid ? 0 : 1;

    } catch (const AcmeError& e) {
        std::cerr << "Error: " << e.what() << " ("
                  << errorCodeToString(e.errorCode()) << ")\n";
        return 1;
    }
}
